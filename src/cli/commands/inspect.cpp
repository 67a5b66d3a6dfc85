// inspect command: prints the canonical view of one model file

#include "cli/commands.h"
#include "core/seal_error.h"
#include "model/adapter_registry.h"
#include "utils/config.h"
#include <exception>
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace modelseal {
namespace cli {
namespace commands {

namespace {

std::string format_shape(const Shape& shape) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << "]";
    return oss.str();
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss.setf(std::ios::fixed);
        oss.precision(1);
        oss << value << " " << units[unit];
    }
    return oss.str();
}

void print_tensors(const std::vector<TensorRecord>& tensors) {
    for (const auto& t : tensors) {
        std::cout << "  " << t.name() << "  " << to_string(t.dtype()) << "  " << format_shape(t.shape())
                  << "  offset=" << t.offset() << "  size=" << format_bytes(t.length()) << std::endl;
    }
}

}  // namespace

bool parseFormatOption(const std::string& text, std::optional<ModelFormat>& out) {
    out.reset();
    if (text.empty()) return true;
    out = parse_model_format(text);
    return out.has_value();
}

int inspect(const InspectOptions& options) {
    std::optional<ModelFormat> forced;
    if (!parseFormatOption(options.format, forced)) {
        std::cerr << "Error: unknown format '" << options.format << "'" << std::endl;
        return kExitUsage;
    }

    try {
        const auto [config, config_log] = loadSealConfigWithLog();
        spdlog::debug("config: {}", config_log);
        const auto registry = AdapterRegistry::with_defaults(config);
        const CanonicalModel model = registry.decode(options.path, forced);

        std::cout << "File:         " << model.file_path.string() << std::endl;
        std::cout << "Format:       " << to_string(model.format);
        if (!model.version.empty()) std::cout << " (" << model.version << ")";
        std::cout << std::endl;
        std::cout << "File size:    " << format_bytes(model.file_size) << std::endl;
        std::cout << "Header size:  " << format_bytes(model.header_size) << std::endl;
        std::cout << "Tensors:      " << model.tensors.size() << std::endl;
        std::cout << "Data size:    " << format_bytes(model.data_size()) << std::endl;
        if (!model.tensors.empty()) {
            std::cout << "Average size: " << format_bytes(model.average_tensor_size()) << std::endl;
        }

        const auto dtypes = model.unique_dtypes();
        if (!dtypes.empty()) {
            std::cout << "Dtypes:       ";
            for (size_t i = 0; i < dtypes.size(); ++i) {
                std::cout << (i > 0 ? ", " : "") << dtypes[i];
            }
            std::cout << std::endl;
        }

        if (!model.backing_files.empty()) {
            std::cout << "Backing files:" << std::endl;
            for (const auto& f : model.backing_files) {
                std::cout << "  " << f.generic_string() << std::endl;
            }
        }

        if (!model.metadata.values.empty()) {
            std::cout << "Metadata:" << std::endl;
            for (const auto& [key, value] : model.metadata.values) {
                std::cout << "  " << key << ": " << (value.is_string() ? value.get<std::string>() : value.dump())
                          << std::endl;
            }
        }

        if (options.detail == "full") {
            const auto shapes = model.unique_shapes();
            if (!shapes.empty()) {
                std::cout << "Shapes:" << std::endl;
                for (const auto& shape : shapes) {
                    std::cout << "  " << format_shape(shape) << std::endl;
                }
            }
        }

        if (options.detail == "full" || !options.filter.empty()) {
            const auto tensors = model.tensors_matching(options.filter);
            std::cout << "Tensor list (" << tensors.size() << "):" << std::endl;
            print_tensors(tensors);
        }
        return kExitOk;
    } catch (const SealError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

}  // namespace commands
}  // namespace cli
}  // namespace modelseal
