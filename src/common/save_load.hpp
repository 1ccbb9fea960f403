#ifndef INSIGHT_COMMON_SAVE_LOAD_HPP
#define INSIGHT_COMMON_SAVE_LOAD_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <torch/torch.h>

#include "../decoder.hpp"
#include "../utils/terminal.hpp"
#include "options.hpp"

namespace Insight::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    inline constexpr const char* kArchitectureFile = "architecture.json";
    inline constexpr const char* kParametersFile = "parameters.binary";

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }

    namespace Detail {
        inline PropertyTree serialize_shape(const std::vector<std::int64_t>& shape)
        {
            PropertyTree array;
            for (const auto extent : shape) {
                PropertyTree value;
                value.put_value(extent);
                array.push_back({"", value});
            }
            return array;
        }

        inline std::vector<std::int64_t> deserialize_shape(const PropertyTree& array, const std::string& context)
        {
            std::vector<std::int64_t> shape;
            for (const auto& [key, value] : array) {
                (void)key;
                try {
                    shape.push_back(value.get_value<std::int64_t>());
                } catch (const boost::property_tree::ptree_error& error) {
                    throw std::runtime_error("Invalid extent in " + context + ": " + error.what());
                }
            }
            return shape;
        }
    }

    /*
     * <directory>/architecture.json  : name, input_shape, options
     * <directory>/parameters.binary  : torch::serialize archive of every parameter and buffer
     * An existing directory is overwritten.
     */
    inline void save(const StandardDecoder& decoder, const std::filesystem::path& directory, std::ostream* stream = &std::cout)
    {
        namespace fs = std::filesystem;
        if (directory.empty()) {
            throw std::invalid_argument("SaveLoad::save requires a non-empty directory path.");
        }
        if (fs::exists(directory)) {
            Utils::Terminal::Log(stream, "Overwriting existing decoder in: " + directory.string(), Utils::Terminal::Level::Warning);
        }
        fs::create_directories(directory);

        const auto architecture_path = directory / kArchitectureFile;
        const auto parameters_path = directory / kParametersFile;

        PropertyTree architecture;
        architecture.put("name", "StandardDecoder");
        architecture.add_child("input_shape", Detail::serialize_shape(decoder->input_shape()));
        architecture.add_child("options", decoder->options().to_tree());

        try {
            write_json_file(architecture_path, architecture);
        } catch (const std::exception& error) {
            throw std::runtime_error(std::string("Failed to write architecture description to '")
                                     + architecture_path.string() + "': " + error.what());
        }

        torch::serialize::OutputArchive archive;
        decoder->save(archive);
        try {
            archive.save_to(parameters_path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to write parameter archive '")
                                     + parameters_path.string() + "': " + error.what());
        }

        Utils::Terminal::Log(stream, "Decoder saved to: " + directory.string());
    }

    // Rebuilds the decoder from its architecture and loads the archive into it.
    // Every stored tensor must match the rebuilt shape.
    [[nodiscard]] inline StandardDecoder load(const std::filesystem::path& directory, torch::Device device = torch::kCPU)
    {
        namespace fs = std::filesystem;
        if (directory.empty()) {
            throw std::invalid_argument("SaveLoad::load requires a non-empty directory path.");
        }

        const auto architecture_path = directory / kArchitectureFile;
        const auto parameters_path = directory / kParametersFile;
        if (!fs::exists(architecture_path)) {
            throw std::runtime_error(std::string("Architecture file not found at '") + architecture_path.string() + "'.");
        }
        if (!fs::exists(parameters_path)) {
            throw std::runtime_error(std::string("Parameter archive not found at '") + parameters_path.string() + "'.");
        }

        PropertyTree architecture;
        try {
            architecture = read_json_file(architecture_path);
        } catch (const std::exception& error) {
            throw std::runtime_error(std::string("Failed to read architecture description from '")
                                     + architecture_path.string() + "': " + error.what());
        }

        const auto shape_node = architecture.get_child_optional("input_shape");
        const auto options_node = architecture.get_child_optional("options");
        if (!shape_node || !options_node) {
            throw std::runtime_error(std::string("Architecture description '") + architecture_path.string()
                                     + "' needs both 'input_shape' and 'options'.");
        }

        StandardDecoder decoder(Options::from_tree(*options_node),
                                Detail::deserialize_shape(*shape_node, architecture_path.string()),
                                device);
        const auto expected = decoder->snapshot();

        torch::serialize::InputArchive archive;
        try {
            archive.load_from(parameters_path.string(), device);
            decoder->load(archive);
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to load parameter archive '")
                                     + parameters_path.string() + "': " + error.what());
        }

        for (const auto& item : decoder->snapshot()) {
            const auto* reference = expected.find(item.key());
            if (reference == nullptr || reference->sizes() != item.value().sizes()) {
                throw std::runtime_error("Parameter '" + item.key() + "' in '" + parameters_path.string()
                                         + "' does not match the rebuilt decoder.");
            }
        }
        return decoder;
    }
}

#endif // INSIGHT_COMMON_SAVE_LOAD_HPP
