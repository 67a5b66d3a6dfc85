// Canonical Model Representation - format-independent tensor/metadata view
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace modelseal {

enum class ModelFormat {
    SafeTensors,
    Onnx,
    Gguf,
    PyTorch,
};

const char* to_string(ModelFormat format);

// Case-insensitive; accepts "safetensors", "onnx", "gguf", "pytorch".
std::optional<ModelFormat> parse_model_format(const std::string& text);

enum class DType {
    F16,
    BF16,
    F32,
    F64,
    F8_E4M3,
    F8_E5M2,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    Bool,
    // GGML block-quantized types
    Q4_0,
    Q4_1,
    Q5_0,
    Q5_1,
    Q8_0,
    Q8_1,
    Q2_K,
    Q3_K,
    Q4_K,
    Q5_K,
    Q6_K,
    Q8_K,
    Other,
};

struct DTypeTraits {
    const char* name;
    uint32_t block_elements;  // elements per storage block (1 for plain types)
    uint32_t block_bytes;     // bytes per storage block (0 when unknown)
};

const DTypeTraits& dtype_traits(DType dtype);
const char* to_string(DType dtype);
std::optional<DType> parse_dtype(const std::string& name);

// Bytes needed for element_count elements, nullopt when the size is unknown
// or element_count is not a whole number of blocks.
std::optional<uint64_t> dtype_storage_bytes(DType dtype, uint64_t element_count);

using Shape = std::vector<uint64_t>;

class TensorRecord {
public:
    TensorRecord(std::string name, DType dtype, Shape shape, uint64_t offset, uint64_t length);

    const std::string& name() const { return name_; }
    DType dtype() const { return dtype_; }
    const Shape& shape() const { return shape_; }
    uint64_t offset() const { return offset_; }
    uint64_t length() const { return length_; }

    // Product of the dimensions; 1 for a scalar.
    uint64_t element_count() const;

private:
    std::string name_;
    DType dtype_;
    Shape shape_;
    uint64_t offset_;
    uint64_t length_;
};

struct GraphNode {
    std::string name;
    std::string op_type;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
};

struct GraphEdge {
    std::string from;
    std::string to;
    std::string tensor;
};

// Values are JSON scalars (string, number, bool). Graph-bearing formats also
// fill nodes/edges; the signing path never reads them.
struct ModelMetadata {
    std::map<std::string, nlohmann::json> values;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    void set(const std::string& key, nlohmann::json value);
    std::optional<std::string> get_string(const std::string& key) const;
    bool empty() const { return values.empty() && nodes.empty(); }
};

struct CanonicalModel {
    ModelFormat format{ModelFormat::SafeTensors};
    std::filesystem::path file_path;
    uint64_t file_size{0};
    uint64_t header_size{0};
    std::string version;
    std::vector<TensorRecord> tensors;
    ModelMetadata metadata;
    // Relative to file_path's directory.
    std::vector<std::filesystem::path> backing_files;

    uint64_t data_size() const;
    uint64_t average_tensor_size() const;
    std::vector<Shape> unique_shapes() const;
    std::vector<std::string> unique_dtypes() const;
    std::vector<TensorRecord> tensors_matching(const std::string& filter) const;

    // Throws SealError(kDecodeError) on duplicate tensor names or tensor
    // ranges past file_size (when file_size is non-zero).
    void validate() const;
};

// Wire form for the isolated inspection process.
nlohmann::json to_json(const CanonicalModel& model);
CanonicalModel canonical_model_from_json(const nlohmann::json& j);

}  // namespace modelseal
