#include "model/canonical_model.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include "core/seal_error.h"

namespace modelseal {

namespace {

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Indexed by DType.
const std::array<DTypeTraits, static_cast<size_t>(DType::Other) + 1> kTraits = {{
    {"F16", 1, 2},
    {"BF16", 1, 2},
    {"F32", 1, 4},
    {"F64", 1, 8},
    {"F8_E4M3", 1, 1},
    {"F8_E5M2", 1, 1},
    {"I8", 1, 1},
    {"I16", 1, 2},
    {"I32", 1, 4},
    {"I64", 1, 8},
    {"U8", 1, 1},
    {"U16", 1, 2},
    {"U32", 1, 4},
    {"U64", 1, 8},
    {"BOOL", 1, 1},
    {"Q4_0", 32, 18},
    {"Q4_1", 32, 20},
    {"Q5_0", 32, 22},
    {"Q5_1", 32, 24},
    {"Q8_0", 32, 34},
    {"Q8_1", 32, 36},
    {"Q2_K", 256, 84},
    {"Q3_K", 256, 110},
    {"Q4_K", 256, 144},
    {"Q5_K", 256, 176},
    {"Q6_K", 256, 210},
    {"Q8_K", 256, 292},
    {"OTHER", 1, 0},
}};

const std::unordered_map<std::string, DType>& dtype_aliases() {
    static const std::unordered_map<std::string, DType> aliases = {
        {"float16", DType::F16},   {"half", DType::F16},
        {"bfloat16", DType::BF16}, {"float32", DType::F32},
        {"float", DType::F32},     {"float64", DType::F64},
        {"double", DType::F64},    {"float8_e4m3fn", DType::F8_E4M3},
        {"float8_e5m2", DType::F8_E5M2},
        {"int8", DType::I8},       {"int16", DType::I16},
        {"short", DType::I16},     {"int32", DType::I32},
        {"int", DType::I32},       {"int64", DType::I64},
        {"long", DType::I64},      {"uint8", DType::U8},
        {"uint16", DType::U16},    {"uint32", DType::U32},
        {"uint64", DType::U64},    {"bool", DType::Bool},
    };
    return aliases;
}

bool checked_mul(uint64_t a, uint64_t b, uint64_t& out) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) return false;
    out = a * b;
    return true;
}

uint64_t shape_volume(const Shape& shape) {
    uint64_t volume = 1;
    for (auto d : shape) {
        if (!checked_mul(volume, d, volume)) return std::numeric_limits<uint64_t>::max();
    }
    return volume;
}

nlohmann::json graph_to_json(const ModelMetadata& metadata) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& n : metadata.nodes) {
        nodes.push_back({{"name", n.name}, {"op_type", n.op_type}, {"inputs", n.inputs}, {"outputs", n.outputs}});
    }
    nlohmann::json edges = nlohmann::json::array();
    for (const auto& e : metadata.edges) {
        edges.push_back({{"from", e.from}, {"to", e.to}, {"tensor", e.tensor}});
    }
    return {{"nodes", nodes}, {"edges", edges}};
}

[[noreturn]] void decode_fail(const std::string& message) {
    throw SealError(ErrorCode::kDecodeError, "invalid canonical model: " + message);
}

}  // namespace

const char* to_string(ModelFormat format) {
    switch (format) {
        case ModelFormat::SafeTensors:
            return "SafeTensors";
        case ModelFormat::Onnx:
            return "ONNX";
        case ModelFormat::Gguf:
            return "GGUF";
        case ModelFormat::PyTorch:
            return "PyTorch";
    }
    return "unknown";
}

std::optional<ModelFormat> parse_model_format(const std::string& text) {
    const std::string lower = to_lower_ascii(text);
    if (lower == "safetensors") return ModelFormat::SafeTensors;
    if (lower == "onnx") return ModelFormat::Onnx;
    if (lower == "gguf") return ModelFormat::Gguf;
    if (lower == "pytorch" || lower == "torch") return ModelFormat::PyTorch;
    return std::nullopt;
}

const DTypeTraits& dtype_traits(DType dtype) {
    return kTraits[static_cast<size_t>(dtype)];
}

const char* to_string(DType dtype) {
    return dtype_traits(dtype).name;
}

std::optional<DType> parse_dtype(const std::string& name) {
    for (size_t i = 0; i < kTraits.size(); ++i) {
        if (name == kTraits[i].name) return static_cast<DType>(i);
    }
    const auto& aliases = dtype_aliases();
    auto it = aliases.find(to_lower_ascii(name));
    if (it != aliases.end()) return it->second;
    return std::nullopt;
}

std::optional<uint64_t> dtype_storage_bytes(DType dtype, uint64_t element_count) {
    const auto& traits = dtype_traits(dtype);
    if (traits.block_bytes == 0) return std::nullopt;
    if (element_count % traits.block_elements != 0) return std::nullopt;
    uint64_t bytes = 0;
    if (!checked_mul(element_count / traits.block_elements, traits.block_bytes, bytes)) {
        return std::nullopt;
    }
    return bytes;
}

TensorRecord::TensorRecord(std::string name, DType dtype, Shape shape, uint64_t offset, uint64_t length)
    : name_(std::move(name)), dtype_(dtype), shape_(std::move(shape)), offset_(offset), length_(length) {}

uint64_t TensorRecord::element_count() const {
    return shape_volume(shape_);
}

void ModelMetadata::set(const std::string& key, nlohmann::json value) {
    if (!value.is_primitive() || value.is_null()) {
        value = value.dump();
    }
    values[key] = std::move(value);
}

std::optional<std::string> ModelMetadata::get_string(const std::string& key) const {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    if (it->second.is_string()) return it->second.get<std::string>();
    return it->second.dump();
}

uint64_t CanonicalModel::data_size() const {
    uint64_t total = 0;
    for (const auto& t : tensors) total += t.length();
    return total;
}

uint64_t CanonicalModel::average_tensor_size() const {
    if (tensors.empty()) return 0;
    return data_size() / tensors.size();
}

std::vector<Shape> CanonicalModel::unique_shapes() const {
    std::set<Shape> seen;
    for (const auto& t : tensors) {
        if (!t.shape().empty()) seen.insert(t.shape());
    }
    std::vector<Shape> out(seen.begin(), seen.end());
    // set order breaks volume ties lexicographically
    std::stable_sort(out.begin(), out.end(), [](const Shape& a, const Shape& b) {
        return shape_volume(a) < shape_volume(b);
    });
    return out;
}

std::vector<std::string> CanonicalModel::unique_dtypes() const {
    std::set<std::string> seen;
    for (const auto& t : tensors) seen.insert(to_string(t.dtype()));
    return std::vector<std::string>(seen.begin(), seen.end());
}

std::vector<TensorRecord> CanonicalModel::tensors_matching(const std::string& filter) const {
    std::vector<TensorRecord> out;
    for (const auto& t : tensors) {
        if (filter.empty() || t.name().find(filter) != std::string::npos) out.push_back(t);
    }
    std::stable_sort(out.begin(), out.end(), [](const TensorRecord& a, const TensorRecord& b) {
        return a.offset() < b.offset();
    });
    return out;
}

void CanonicalModel::validate() const {
    std::unordered_set<std::string> names;
    for (const auto& t : tensors) {
        if (!names.insert(t.name()).second) {
            throw SealError(ErrorCode::kDecodeError, "duplicate tensor name '" + t.name() + "'", file_path);
        }
        if (file_size == 0) continue;
        if (t.offset() > file_size || t.length() > file_size - t.offset()) {
            throw SealError(ErrorCode::kDecodeError,
                            "tensor '" + t.name() + "' extends past end of file", file_path);
        }
    }
}

nlohmann::json to_json(const CanonicalModel& model) {
    nlohmann::json tensors = nlohmann::json::array();
    for (const auto& t : model.tensors) {
        tensors.push_back({
            {"name", t.name()},
            {"dtype", to_string(t.dtype())},
            {"shape", t.shape()},
            {"offset", t.offset()},
            {"length", t.length()},
        });
    }
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : model.metadata.values) metadata[key] = value;

    nlohmann::json backing = nlohmann::json::array();
    for (const auto& p : model.backing_files) backing.push_back(p.generic_string());

    return {
        {"format", to_string(model.format)},
        {"file_path", model.file_path.string()},
        {"file_size", model.file_size},
        {"header_size", model.header_size},
        {"version", model.version},
        {"tensors", tensors},
        {"metadata", metadata},
        {"graph", graph_to_json(model.metadata)},
        {"backing_files", backing},
    };
}

CanonicalModel canonical_model_from_json(const nlohmann::json& j) {
    if (!j.is_object()) decode_fail("expected a JSON object");
    if (!j.contains("format") || !j["format"].is_string()) decode_fail("missing 'format'");

    CanonicalModel model;
    auto format = parse_model_format(j["format"].get<std::string>());
    if (!format) decode_fail("unknown format '" + j["format"].get<std::string>() + "'");
    model.format = *format;

    try {
        model.file_path = j.value("file_path", std::string());
        model.file_size = j.value("file_size", uint64_t{0});
        model.header_size = j.value("header_size", uint64_t{0});
        model.version = j.value("version", std::string());

        if (j.contains("tensors")) {
            if (!j["tensors"].is_array()) decode_fail("'tensors' must be an array");
            for (const auto& t : j["tensors"]) {
                const std::string name = t.at("name").get<std::string>();
                const std::string dtype_name = t.at("dtype").get<std::string>();
                const DType dtype = parse_dtype(dtype_name).value_or(DType::Other);
                const auto& dims = t.at("shape");
                if (!dims.is_array()) decode_fail("tensor '" + name + "' has a non-array shape");
                Shape shape;
                for (const auto& dim : dims) {
                    const bool non_negative =
                        dim.is_number_unsigned() || (dim.is_number_integer() && dim.get<int64_t>() >= 0);
                    if (!non_negative) decode_fail("tensor '" + name + "' has a negative or non-integer dimension");
                    shape.push_back(dim.get<uint64_t>());
                }
                model.tensors.emplace_back(name, dtype, std::move(shape),
                                           t.value("offset", uint64_t{0}),
                                           t.value("length", uint64_t{0}));
            }
        }

        if (j.contains("metadata")) {
            if (!j["metadata"].is_object()) decode_fail("'metadata' must be an object");
            for (auto it = j["metadata"].begin(); it != j["metadata"].end(); ++it) {
                model.metadata.set(it.key(), it.value());
            }
        }

        if (j.contains("graph") && j["graph"].is_object()) {
            for (const auto& n : j["graph"].value("nodes", nlohmann::json::array())) {
                GraphNode node;
                node.name = n.value("name", std::string());
                node.op_type = n.value("op_type", std::string());
                node.inputs = n.value("inputs", std::vector<std::string>{});
                node.outputs = n.value("outputs", std::vector<std::string>{});
                model.metadata.nodes.push_back(std::move(node));
            }
            for (const auto& e : j["graph"].value("edges", nlohmann::json::array())) {
                model.metadata.edges.push_back(
                    {e.value("from", std::string()), e.value("to", std::string()), e.value("tensor", std::string())});
            }
        }

        if (j.contains("backing_files")) {
            for (const auto& p : j["backing_files"]) {
                model.backing_files.emplace_back(p.get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        decode_fail(e.what());
    }

    model.validate();
    return model;
}

}  // namespace modelseal
