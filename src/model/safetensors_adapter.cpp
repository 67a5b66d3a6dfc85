#include "model/safetensors_adapter.h"

#include <cctype>
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/seal_error.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace modelseal {

namespace {

constexpr size_t ST_HEADER_SIZE_LEN = 8;
constexpr uint64_t ST_MAX_HEADER_SIZE = 100ULL * 1024 * 1024;
constexpr const char* ST_INDEX_SUFFIX = ".safetensors.index.json";

bool ends_with_case_insensitive(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) return false;
    const size_t offset = value.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        const auto lhs = static_cast<unsigned char>(value[offset + i]);
        const auto rhs = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(lhs) != std::tolower(rhs)) return false;
    }
    return true;
}

uint64_t read_u64_le(const uint8_t* buf) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | buf[i];
    }
    return v;
}

[[noreturn]] void fail(const std::string& message, const fs::path& path) {
    throw SealError(ErrorCode::kDecodeError, message, path);
}

json read_json_file(const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) fail("failed to open", path);
    try {
        json j;
        ifs >> j;
        return j;
    } catch (const json::exception& e) {
        fail(std::string("invalid JSON (") + e.what() + ")", path);
    }
}

}  // namespace

bool is_safetensors_index_file(const fs::path& path) {
    return ends_with_case_insensitive(path.filename().string(), ST_INDEX_SUFFIX);
}

bool SafeTensorsAdapter::accepts(const fs::path& path, Scope scope) const {
    (void)scope;
    return ends_with_case_insensitive(path.filename().string(), ".safetensors");
}

CanonicalModel SafeTensorsAdapter::decode(const fs::path& path) const {
    std::error_code ec;
    const uint64_t file_size = fs::file_size(path, ec);
    if (ec) fail("failed to stat (" + ec.message() + ")", path);
    if (file_size < ST_HEADER_SIZE_LEN) fail("file too small for a safetensors header", path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) fail("failed to open", path);

    uint8_t header_size_buf[ST_HEADER_SIZE_LEN];
    file.read(reinterpret_cast<char*>(header_size_buf), ST_HEADER_SIZE_LEN);
    if (!file) fail("failed to read header size", path);

    const uint64_t header_size = read_u64_le(header_size_buf);
    if (header_size > ST_MAX_HEADER_SIZE || header_size > file_size - ST_HEADER_SIZE_LEN) {
        fail("header size " + std::to_string(header_size) + " exceeds file bounds", path);
    }

    std::string header_buf(static_cast<size_t>(header_size), '\0');
    file.read(header_buf.data(), static_cast<std::streamsize>(header_size));
    if (!file) fail("failed to read header", path);

    json header;
    try {
        header = json::parse(header_buf);
    } catch (const json::exception& e) {
        fail(std::string("invalid JSON header (") + e.what() + ")", path);
    }
    if (!header.is_object()) fail("invalid JSON header (expected '{')", path);

    CanonicalModel model;
    model.format = ModelFormat::SafeTensors;
    model.file_path = path;
    model.file_size = file_size;
    model.header_size = header_size;
    model.version = "0.x";

    const uint64_t data_offset = ST_HEADER_SIZE_LEN + header_size;
    const uint64_t data_section_size = file_size - data_offset;

    for (auto it = header.begin(); it != header.end(); ++it) {
        const std::string& name = it.key();
        const json& entry = it.value();
        if (name == "__metadata__") {
            if (!entry.is_object()) fail("__metadata__ must be an object", path);
            for (auto m = entry.begin(); m != entry.end(); ++m) {
                model.metadata.set(m.key(), m.value());
            }
            continue;
        }
        if (!entry.is_object()) fail("invalid entry for tensor: " + name, path);
        if (!entry.contains("dtype") || !entry["dtype"].is_string()) fail("missing dtype for tensor: " + name, path);
        if (!entry.contains("shape") || !entry["shape"].is_array()) fail("missing shape for tensor: " + name, path);
        if (!entry.contains("data_offsets") || !entry["data_offsets"].is_array() || entry["data_offsets"].size() != 2) {
            fail("missing data_offsets for tensor: " + name, path);
        }

        const std::string dtype_name = entry["dtype"].get<std::string>();
        auto dtype = parse_dtype(dtype_name);
        if (!dtype) fail("unknown dtype '" + dtype_name + "' for tensor: " + name, path);

        Shape shape;
        for (const auto& dim : entry["shape"]) {
            if (!dim.is_number_unsigned()) fail("invalid shape for tensor: " + name, path);
            shape.push_back(dim.get<uint64_t>());
        }

        const auto& offsets = entry["data_offsets"];
        if (!offsets[0].is_number_unsigned() || !offsets[1].is_number_unsigned()) {
            fail("invalid data_offsets for tensor: " + name, path);
        }
        const uint64_t begin = offsets[0].get<uint64_t>();
        const uint64_t end = offsets[1].get<uint64_t>();
        if (end < begin) fail("invalid data_offsets (end < begin) for tensor: " + name, path);
        if (end > data_section_size) fail("data_offsets out of bounds for tensor: " + name, path);

        TensorRecord record(name, *dtype, std::move(shape), data_offset + begin, end - begin);
        auto expected = dtype_storage_bytes(record.dtype(), record.element_count());
        if (expected && *expected != record.length()) {
            fail("byte length does not match shape for tensor: " + name, path);
        }
        model.tensors.push_back(std::move(record));
    }

    model.validate();
    spdlog::debug("SafeTensors: {} tensors, header {} bytes in {}", model.tensors.size(), header_size, path.string());
    return model;
}

bool SafeTensorsIndexAdapter::accepts(const fs::path& path, Scope scope) const {
    (void)scope;
    return is_safetensors_index_file(path);
}

CanonicalModel SafeTensorsIndexAdapter::decode(const fs::path& path) const {
    const json index = read_json_file(path);
    if (!index.is_object()) fail("index must be a JSON object", path);

    CanonicalModel model;
    model.format = ModelFormat::SafeTensors;
    model.file_path = path;
    std::error_code ec;
    model.file_size = fs::file_size(path, ec);
    if (ec) model.file_size = 0;
    model.version = "index";

    if (index.contains("metadata")) {
        if (!index["metadata"].is_object()) fail("'metadata' must be an object", path);
        for (auto it = index["metadata"].begin(); it != index["metadata"].end(); ++it) {
            model.metadata.set(it.key(), it.value());
        }
    }
    model.backing_files = backing_files(path);
    return model;
}

std::vector<fs::path> SafeTensorsIndexAdapter::backing_files(const fs::path& path) const {
    const json index = read_json_file(path);
    if (!index.is_object() || !index.contains("weight_map") || !index["weight_map"].is_object()) {
        fail("index has no weight_map object", path);
    }
    std::set<std::string> unique;
    for (auto it = index["weight_map"].begin(); it != index["weight_map"].end(); ++it) {
        if (!it.value().is_string() || it.value().get<std::string>().empty()) {
            fail("weight_map entry for '" + it.key() + "' is not a file name", path);
        }
        unique.insert(it.value().get<std::string>());
    }
    return std::vector<fs::path>(unique.begin(), unique.end());
}

}  // namespace modelseal
