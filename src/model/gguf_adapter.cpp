#include "model/gguf_adapter.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <limits>
#include <type_traits>
#include <spdlog/spdlog.h>

#include "core/seal_error.h"

namespace fs = std::filesystem;

namespace modelseal {

namespace {
constexpr uint32_t GGUF_MAGIC = 0x46554747;  // "GGUF" in little-endian
constexpr uint32_t GGUF_DEFAULT_ALIGNMENT = 32;
constexpr uint32_t GGUF_MAX_DIMS = 8;
constexpr uint64_t MAX_STRING_LENGTH = 1ULL << 30;

enum GgufValueType : uint32_t {
    GGUF_TYPE_UINT8 = 0,
    GGUF_TYPE_INT8 = 1,
    GGUF_TYPE_UINT16 = 2,
    GGUF_TYPE_INT16 = 3,
    GGUF_TYPE_UINT32 = 4,
    GGUF_TYPE_INT32 = 5,
    GGUF_TYPE_FLOAT32 = 6,
    GGUF_TYPE_BOOL = 7,
    GGUF_TYPE_STRING = 8,
    GGUF_TYPE_ARRAY = 9,
    GGUF_TYPE_UINT64 = 10,
    GGUF_TYPE_INT64 = 11,
    GGUF_TYPE_FLOAT64 = 12,
};

const char* value_type_name(uint32_t type) {
    switch (type) {
        case GGUF_TYPE_UINT8: return "u8";
        case GGUF_TYPE_INT8: return "i8";
        case GGUF_TYPE_UINT16: return "u16";
        case GGUF_TYPE_INT16: return "i16";
        case GGUF_TYPE_UINT32: return "u32";
        case GGUF_TYPE_INT32: return "i32";
        case GGUF_TYPE_FLOAT32: return "f32";
        case GGUF_TYPE_BOOL: return "bool";
        case GGUF_TYPE_STRING: return "string";
        case GGUF_TYPE_ARRAY: return "array";
        case GGUF_TYPE_UINT64: return "u64";
        case GGUF_TYPE_INT64: return "i64";
        case GGUF_TYPE_FLOAT64: return "f64";
    }
    return "unknown";
}

size_t scalar_size(uint32_t type) {
    switch (type) {
        case GGUF_TYPE_UINT8:
        case GGUF_TYPE_INT8:
        case GGUF_TYPE_BOOL:
            return 1;
        case GGUF_TYPE_UINT16:
        case GGUF_TYPE_INT16:
            return 2;
        case GGUF_TYPE_UINT32:
        case GGUF_TYPE_INT32:
        case GGUF_TYPE_FLOAT32:
            return 4;
        case GGUF_TYPE_UINT64:
        case GGUF_TYPE_INT64:
        case GGUF_TYPE_FLOAT64:
            return 8;
    }
    return 0;
}

DType dtype_from_ggml(uint32_t type) {
    switch (type) {
        case 0: return DType::F32;
        case 1: return DType::F16;
        case 2: return DType::Q4_0;
        case 3: return DType::Q4_1;
        case 6: return DType::Q5_0;
        case 7: return DType::Q5_1;
        case 8: return DType::Q8_0;
        case 9: return DType::Q8_1;
        case 10: return DType::Q2_K;
        case 11: return DType::Q3_K;
        case 12: return DType::Q4_K;
        case 13: return DType::Q5_K;
        case 14: return DType::Q6_K;
        case 15: return DType::Q8_K;
        case 24: return DType::I8;
        case 25: return DType::I16;
        case 26: return DType::I32;
        case 27: return DType::I64;
        case 28: return DType::F64;
        case 30: return DType::BF16;
    }
    return DType::Other;
}

// Bounds-checked little-endian reader; every failure is a decode error.
class HeaderReader {
public:
    HeaderReader(const fs::path& path, uint64_t file_size)
        : path_(path), file_(path, std::ios::binary), file_size_(file_size) {
        if (!file_.is_open()) fail("failed to open");
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw SealError(ErrorCode::kDecodeError, "failed to parse GGUF file: " + message, path_);
    }

    uint64_t position() const { return pos_; }
    uint64_t remaining() const { return file_size_ - pos_; }

    void read_raw(void* out, size_t size) {
        if (size > remaining()) fail("unexpected end of file");
        file_.read(static_cast<char*>(out), static_cast<std::streamsize>(size));
        if (!file_) fail("read error");
        pos_ += size;
    }

    void skip(uint64_t size) {
        if (size > remaining()) fail("unexpected end of file");
        file_.seekg(static_cast<std::streamoff>(size), std::ios::cur);
        if (!file_) fail("seek error");
        pos_ += size;
    }

    template <typename T>
    T read() {
        uint8_t buf[sizeof(T)];
        read_raw(buf, sizeof(T));
        uint64_t bits = 0;
        for (size_t i = sizeof(T); i-- > 0;) bits = (bits << 8) | buf[i];
        T value;
        if constexpr (sizeof(T) == 8) {
            std::memcpy(&value, &bits, sizeof(T));
        } else {
            auto narrowed = static_cast<std::conditional_t<sizeof(T) == 4, uint32_t,
                                        std::conditional_t<sizeof(T) == 2, uint16_t, uint8_t>>>(bits);
            std::memcpy(&value, &narrowed, sizeof(T));
        }
        return value;
    }

    std::string read_string() {
        const uint64_t length = read<uint64_t>();
        if (length > MAX_STRING_LENGTH || length > remaining()) fail("string length out of bounds");
        std::string s(static_cast<size_t>(length), '\0');
        if (length > 0) read_raw(s.data(), s.size());
        return s;
    }

    nlohmann::json read_scalar(uint32_t type) {
        switch (type) {
            case GGUF_TYPE_UINT8: return read<uint8_t>();
            case GGUF_TYPE_INT8: return read<int8_t>();
            case GGUF_TYPE_UINT16: return read<uint16_t>();
            case GGUF_TYPE_INT16: return read<int16_t>();
            case GGUF_TYPE_UINT32: return read<uint32_t>();
            case GGUF_TYPE_INT32: return read<int32_t>();
            case GGUF_TYPE_FLOAT32: return read<float>();
            case GGUF_TYPE_BOOL: return read<uint8_t>() != 0;
            case GGUF_TYPE_STRING: return read_string();
            case GGUF_TYPE_UINT64: return read<uint64_t>();
            case GGUF_TYPE_INT64: return read<int64_t>();
            case GGUF_TYPE_FLOAT64: return read<double>();
        }
        fail("unknown value type " + std::to_string(type));
    }

    // Arrays are summarised, not materialised.
    nlohmann::json read_array() {
        const uint32_t item_type = read<uint32_t>();
        const uint64_t count = read<uint64_t>();
        if (item_type == GGUF_TYPE_STRING) {
            if (count > remaining() / 8) fail("array length out of bounds");
            for (uint64_t i = 0; i < count; ++i) {
                const uint64_t length = read<uint64_t>();
                skip(length);
            }
        } else if (item_type == GGUF_TYPE_ARRAY) {
            fail("nested arrays are not supported");
        } else {
            const size_t size = scalar_size(item_type);
            if (size == 0) fail("unknown array item type " + std::to_string(item_type));
            if (count > remaining() / size) fail("array length out of bounds");
            skip(count * size);
        }
        return std::string("array<") + value_type_name(item_type) + ">[" + std::to_string(count) + "]";
    }

private:
    fs::path path_;
    std::ifstream file_;
    uint64_t file_size_;
    uint64_t pos_{0};
};

struct RawTensorInfo {
    std::string name;
    Shape shape;
    uint32_t ggml_type;
    uint64_t offset;
};

}  // namespace

bool GgufAdapter::accepts(const fs::path& path, Scope scope) const {
    (void)scope;
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".gguf";
}

CanonicalModel GgufAdapter::decode(const fs::path& path) const {
    std::error_code ec;
    const uint64_t file_size = fs::file_size(path, ec);
    if (ec) throw SealError(ErrorCode::kDecodeError, "failed to stat (" + ec.message() + ")", path);

    HeaderReader reader(path, file_size);
    if (reader.read<uint32_t>() != GGUF_MAGIC) reader.fail("bad magic");
    const uint32_t version = reader.read<uint32_t>();
    if (version != 2 && version != 3) reader.fail("unsupported version " + std::to_string(version));

    const uint64_t tensor_count = reader.read<uint64_t>();
    const uint64_t kv_count = reader.read<uint64_t>();
    if (tensor_count > reader.remaining() || kv_count > reader.remaining()) {
        reader.fail("header counts exceed file size");
    }

    CanonicalModel model;
    model.format = ModelFormat::Gguf;
    model.file_path = path;
    model.file_size = file_size;
    model.version = std::to_string(version);

    uint32_t alignment = GGUF_DEFAULT_ALIGNMENT;
    for (uint64_t i = 0; i < kv_count; ++i) {
        const std::string key = reader.read_string();
        const uint32_t type = reader.read<uint32_t>();
        nlohmann::json value = type == GGUF_TYPE_ARRAY ? reader.read_array() : reader.read_scalar(type);
        if (key == "general.alignment") {
            if (type != GGUF_TYPE_UINT32) reader.fail("general.alignment must be u32");
            alignment = value.get<uint32_t>();
            if (alignment == 0 || (alignment & (alignment - 1)) != 0) reader.fail("invalid alignment");
        }
        model.metadata.set(key, std::move(value));
    }

    std::vector<RawTensorInfo> infos;
    infos.reserve(static_cast<size_t>(tensor_count));
    for (uint64_t i = 0; i < tensor_count; ++i) {
        RawTensorInfo info;
        info.name = reader.read_string();
        const uint32_t n_dims = reader.read<uint32_t>();
        if (n_dims > GGUF_MAX_DIMS) reader.fail("too many dimensions for tensor " + info.name);
        for (uint32_t d = 0; d < n_dims; ++d) info.shape.push_back(reader.read<uint64_t>());
        info.ggml_type = reader.read<uint32_t>();
        info.offset = reader.read<uint64_t>();
        infos.push_back(std::move(info));
    }

    const uint64_t header_end = reader.position();
    const uint64_t data_offset = (header_end + alignment - 1) / alignment * alignment;
    if (data_offset > file_size && tensor_count > 0) reader.fail("data section starts past end of file");
    model.header_size = header_end;

    // Unknown block layouts take their length from the next tensor's offset.
    std::vector<uint64_t> offsets;
    offsets.reserve(infos.size());
    for (const auto& info : infos) offsets.push_back(info.offset);
    std::sort(offsets.begin(), offsets.end());

    for (auto& info : infos) {
        if (info.offset > std::numeric_limits<uint64_t>::max() - data_offset) {
            reader.fail("tensor offset overflow for " + info.name);
        }
        const DType dtype = dtype_from_ggml(info.ggml_type);
        const uint64_t absolute = data_offset + info.offset;
        TensorRecord sized(info.name, dtype, info.shape, absolute, 0);
        uint64_t length = 0;
        if (auto bytes = dtype_storage_bytes(dtype, sized.element_count())) {
            length = *bytes;
        } else {
            auto next = std::upper_bound(offsets.begin(), offsets.end(), info.offset);
            const uint64_t end = next == offsets.end() ? file_size : data_offset + *next;
            length = end > absolute ? end - absolute : 0;
        }
        model.tensors.emplace_back(std::move(info.name), dtype, std::move(info.shape), absolute, length);
    }

    model.validate();
    spdlog::debug("GGUF v{}: {} tensors, {} metadata keys in {}", version, model.tensors.size(), kv_count,
                  path.string());
    return model;
}

}  // namespace modelseal
