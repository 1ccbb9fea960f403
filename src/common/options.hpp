#ifndef INSIGHT_COMMON_OPTIONS_HPP
#define INSIGHT_COMMON_OPTIONS_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "../activation/apply.hpp"

namespace Insight {
    // One decoded variable. `loss` is empty when the caller computes losses itself.
    struct TargetOptions {
        std::string name{};
        std::int64_t output_dim{1};
        std::string loss{};
        double weight{1.0};
    };

    // Run configuration shared by the dataset layer and the decoder.
    // Built in code with designated initializers or read from JSON through from_tree().
    struct Options {
        std::int64_t model_timesteps{64};
        std::int64_t num_cvs{5};
        bool shuffle{false};
        bool random_batches{false};
        std::vector<TargetOptions> targets{};

        std::int64_t num_convs_tsr{4};
        std::int64_t filter_size{64};
        std::int64_t kernel_size{3};
        std::string act_conv{"ELU"};
        std::string act_fc{"ELU"};
        std::int64_t num_dense{2};
        std::int64_t num_units_dense{1024};
        double dropout_ratio{0.5};

        double trunk_dropout{0.0};
        double noise_sigma{0.1};
        std::int64_t batch_size{8};
        std::size_t max_filter_retries{10000};

        [[nodiscard]] std::vector<std::string> target_names() const
        {
            std::vector<std::string> names;
            names.reserve(targets.size());
            for (const auto& target : targets) {
                names.push_back(target.name);
            }
            return names;
        }

        void validate() const
        {
            if (model_timesteps < 2) {
                throw std::invalid_argument("model_timesteps must be at least 2, got " + std::to_string(model_timesteps) + ".");
            }
            if (num_cvs < 2) {
                throw std::invalid_argument("num_cvs must be at least 2, got " + std::to_string(num_cvs) + ".");
            }
            if (targets.empty()) {
                throw std::invalid_argument("At least one output target must be configured.");
            }
            std::unordered_set<std::string> seen;
            for (const auto& target : targets) {
                if (target.name.empty()) {
                    throw std::invalid_argument("Output target names must not be empty.");
                }
                if (!seen.insert(target.name).second) {
                    throw std::invalid_argument("Output target '" + target.name + "' is configured twice.");
                }
                if (target.output_dim <= 0) {
                    throw std::invalid_argument("Output target '" + target.name + "' needs a positive output dimension.");
                }
                if (target.weight < 0.0) {
                    throw std::invalid_argument("Loss weight of '" + target.name + "' must be non-negative.");
                }
            }
            if (num_convs_tsr < 1) {
                throw std::invalid_argument("num_convs_tsr must be at least 1.");
            }
            if (filter_size <= 0 || kernel_size <= 0) {
                throw std::invalid_argument("filter_size and kernel_size must be positive.");
            }
            if (num_dense < 0) {
                throw std::invalid_argument("num_dense must be non-negative.");
            }
            if (num_dense > 0 && num_units_dense <= 0) {
                throw std::invalid_argument("num_units_dense must be positive when dense layers are requested.");
            }
            if (dropout_ratio < 0.0 || dropout_ratio >= 1.0 || trunk_dropout < 0.0 || trunk_dropout >= 1.0) {
                throw std::invalid_argument("Dropout rates must be in the range [0, 1).");
            }
            if (noise_sigma < 0.0) {
                throw std::invalid_argument("noise_sigma must be non-negative.");
            }
            if (batch_size <= 0) {
                throw std::invalid_argument("batch_size must be positive.");
            }
            if (max_filter_retries == 0) {
                throw std::invalid_argument("max_filter_retries must be positive.");
            }
            (void)Activation::Details::parse(act_conv);
            (void)Activation::Details::parse(act_fc);
        }

        // Reads a JSON-shaped tree. Unknown keys and missing required keys are fatal.
        [[nodiscard]] static Options from_tree(const boost::property_tree::ptree& tree);
        [[nodiscard]] boost::property_tree::ptree to_tree() const;
    };

    namespace Detail {
        inline const std::set<std::string>& required_option_keys()
        {
            static const std::set<std::string> keys{
                "model_timesteps", "num_cvs", "outputs", "num_convs_tsr", "filter_size", "kernel_size",
                "act_conv", "act_fc", "num_dense", "num_units_dense", "dropout_ratio"};
            return keys;
        }

        inline const std::set<std::string>& optional_option_keys()
        {
            static const std::set<std::string> keys{
                "shuffle", "random_batches", "loss_functions", "loss_weights", "trunk_dropout",
                "noise_sigma", "batch_size", "max_filter_retries"};
            return keys;
        }

        template <class T>
        T read_value(const boost::property_tree::ptree& node, const std::string& key)
        {
            try {
                return node.get_value<T>();
            } catch (const boost::property_tree::ptree_error& error) {
                throw std::invalid_argument("Option '" + key + "' has an invalid value: " + error.what());
            }
        }

        inline TargetOptions& find_target(std::vector<TargetOptions>& targets, const std::string& name, const std::string& section)
        {
            auto it = std::find_if(targets.begin(), targets.end(),
                                   [&](const TargetOptions& target) { return target.name == name; });
            if (it == targets.end()) {
                throw std::invalid_argument("'" + section + "' names '" + name + "', which is not listed in 'outputs'.");
            }
            return *it;
        }
    }

    inline Options Options::from_tree(const boost::property_tree::ptree& tree)
    {
        for (const auto& [key, value] : tree) {
            (void)value;
            if (!Detail::required_option_keys().count(key) && !Detail::optional_option_keys().count(key)) {
                throw std::invalid_argument("Unknown option '" + key + "'.");
            }
        }
        for (const auto& key : Detail::required_option_keys()) {
            if (tree.find(key) == tree.not_found()) {
                throw std::invalid_argument("Missing required option '" + key + "'.");
            }
        }

        Options options{};
        options.targets.clear();

        for (const auto& [key, node] : tree) {
            if (key == "model_timesteps") options.model_timesteps = Detail::read_value<std::int64_t>(node, key);
            else if (key == "num_cvs") options.num_cvs = Detail::read_value<std::int64_t>(node, key);
            else if (key == "shuffle") options.shuffle = Detail::read_value<bool>(node, key);
            else if (key == "random_batches") options.random_batches = Detail::read_value<bool>(node, key);
            else if (key == "num_convs_tsr") options.num_convs_tsr = Detail::read_value<std::int64_t>(node, key);
            else if (key == "filter_size") options.filter_size = Detail::read_value<std::int64_t>(node, key);
            else if (key == "kernel_size") options.kernel_size = Detail::read_value<std::int64_t>(node, key);
            else if (key == "act_conv") options.act_conv = Detail::read_value<std::string>(node, key);
            else if (key == "act_fc") options.act_fc = Detail::read_value<std::string>(node, key);
            else if (key == "num_dense") options.num_dense = Detail::read_value<std::int64_t>(node, key);
            else if (key == "num_units_dense") options.num_units_dense = Detail::read_value<std::int64_t>(node, key);
            else if (key == "dropout_ratio") options.dropout_ratio = Detail::read_value<double>(node, key);
            else if (key == "trunk_dropout") options.trunk_dropout = Detail::read_value<double>(node, key);
            else if (key == "noise_sigma") options.noise_sigma = Detail::read_value<double>(node, key);
            else if (key == "batch_size") options.batch_size = Detail::read_value<std::int64_t>(node, key);
            else if (key == "max_filter_retries") {
                const auto retries = Detail::read_value<std::int64_t>(node, key);
                if (retries <= 0) {
                    throw std::invalid_argument("max_filter_retries must be positive, got " + std::to_string(retries) + ".");
                }
                options.max_filter_retries = static_cast<std::size_t>(retries);
            }
        }

        // "outputs" fixes target order; the loss mappings only annotate it.
        for (const auto& [name, node] : tree.get_child("outputs")) {
            options.targets.push_back(TargetOptions{name, Detail::read_value<std::int64_t>(node, "outputs." + name)});
        }
        if (const auto losses = tree.get_child_optional("loss_functions")) {
            for (const auto& [name, node] : *losses) {
                Detail::find_target(options.targets, name, "loss_functions").loss =
                    Detail::read_value<std::string>(node, "loss_functions." + name);
            }
        }
        if (const auto weights = tree.get_child_optional("loss_weights")) {
            for (const auto& [name, node] : *weights) {
                Detail::find_target(options.targets, name, "loss_weights").weight =
                    Detail::read_value<double>(node, "loss_weights." + name);
            }
        }

        options.validate();
        return options;
    }

    inline boost::property_tree::ptree Options::to_tree() const
    {
        boost::property_tree::ptree tree;
        tree.put("model_timesteps", model_timesteps);
        tree.put("num_cvs", num_cvs);
        tree.put("shuffle", shuffle);
        tree.put("random_batches", random_batches);

        boost::property_tree::ptree outputs;
        boost::property_tree::ptree losses;
        boost::property_tree::ptree weights;
        for (const auto& target : targets) {
            // push_back keeps insertion order and avoids '.' path splitting in names.
            outputs.push_back({target.name, boost::property_tree::ptree(std::to_string(target.output_dim))});
            if (!target.loss.empty()) {
                losses.push_back({target.name, boost::property_tree::ptree(target.loss)});
            }
            boost::property_tree::ptree weight;
            weight.put_value(target.weight);
            weights.push_back({target.name, weight});
        }
        tree.add_child("outputs", outputs);
        if (!losses.empty()) {
            tree.add_child("loss_functions", losses);
        }
        tree.add_child("loss_weights", weights);

        tree.put("num_convs_tsr", num_convs_tsr);
        tree.put("filter_size", filter_size);
        tree.put("kernel_size", kernel_size);
        tree.put("act_conv", act_conv);
        tree.put("act_fc", act_fc);
        tree.put("num_dense", num_dense);
        tree.put("num_units_dense", num_units_dense);
        tree.put("dropout_ratio", dropout_ratio);
        tree.put("trunk_dropout", trunk_dropout);
        tree.put("noise_sigma", noise_sigma);
        tree.put("batch_size", batch_size);
        tree.put("max_filter_retries", max_filter_retries);
        return tree;
    }
}

#endif // INSIGHT_COMMON_OPTIONS_HPP
