#ifndef UGP_COMMON_SAVE_LOAD_HPP
#define UGP_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <torch/torch.h>

#include "tensor.hpp"
#include "../utils/terminal.hpp"

namespace Ugp::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    // Layout of one checkpoint directory `<prefix>-<step>`.
    inline constexpr const char* kParametersFile = "parameters.binary";
    inline constexpr const char* kOptimizerFile = "optimizer.binary";
    inline constexpr const char* kMetadataFile = "checkpoint.json";
    // Sits next to the checkpoint directories and names the newest one.
    inline constexpr const char* kIndexFile = "checkpoint";
    inline constexpr int kFormatVersion = 1;

    struct RestoreReport {
        std::int64_t step{0};
        std::vector<std::string> missing{};     // expected by the model, absent from the checkpoint
        std::vector<std::string> unexpected{};  // stored in the checkpoint, unknown to the model
        bool optimizer_restored{false};

        [[nodiscard]] bool complete() const noexcept { return missing.empty() && unexpected.empty(); }
    };

    namespace Detail {
        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }

        inline std::string join(const std::vector<std::string>& values)
        {
            std::string out;
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += values[i];
            }
            return out;
        }

        // Parameters and defined buffers of a module, keyed by their dotted path.
        inline std::vector<std::pair<std::string, torch::Tensor>> named_state(const torch::nn::Module& module)
        {
            std::vector<std::pair<std::string, torch::Tensor>> state;
            for (const auto& item : module.named_parameters(/*recurse=*/true)) {
                state.emplace_back(item.key(), item.value());
            }
            for (const auto& item : module.named_buffers(/*recurse=*/true)) {
                if (item.value().defined()) {
                    state.emplace_back(item.key(), item.value());
                }
            }
            return state;
        }

        inline std::optional<std::int64_t> step_of(const std::filesystem::path& directory)
        {
            const auto metadata = directory / kMetadataFile;
            std::error_code error;
            if (!std::filesystem::is_regular_file(metadata, error)) {
                return std::nullopt;
            }
            try {
                PropertyTree tree;
                boost::property_tree::read_json(metadata.string(), tree);
                return tree.get_optional<std::int64_t>("step").value_or(0);
            } catch (const boost::property_tree::ptree_error&) {
                return std::nullopt;
            }
        }

        inline void replace_file(const std::filesystem::path& target, const std::string& contents)
        {
            auto staging = target;
            staging += ".tmp";
            {
                std::ofstream stream(staging, std::ios::trunc);
                if (!stream) {
                    throw std::runtime_error("Failed to open '" + staging.string() + "' for writing.");
                }
                stream << contents << '\n';
            }
            std::filesystem::rename(staging, target);
        }
    }

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

    // Writes `<prefix>-<step>` next to the prefix and points the index file at it. The
    // directory is assembled under a temporary name and renamed into place, so a reader
    // sees either the whole checkpoint or none of it.
    inline std::filesystem::path save(const std::filesystem::path& prefix,
                                      const torch::nn::Module& model,
                                      const torch::optim::Optimizer* optimizer,
                                      std::int64_t step,
                                      std::ostream* stream = &std::cout)
    {
        namespace fs = std::filesystem;
        if (prefix.filename().empty()) {
            throw std::invalid_argument("Checkpoint prefix must name a file, got '" + prefix.string() + "'.");
        }
        if (step < 0) {
            throw std::invalid_argument("Checkpoint step must be non-negative, got " + std::to_string(step) + ".");
        }

        const auto directory = prefix.has_parent_path() ? prefix.parent_path() : fs::path(".");
        const auto name = prefix.filename().string() + "-" + std::to_string(step);
        const auto target = directory / name;
        const auto staging = directory / (name + ".tmp");

        fs::create_directories(directory);
        fs::remove_all(staging);
        fs::create_directories(staging);

        PropertyTree metadata;
        metadata.put("format_version", kFormatVersion);
        metadata.put("step", step);
        PropertyTree parameters;

        torch::serialize::OutputArchive archive;
        for (const auto& [key, value] : Detail::named_state(model)) {
            archive.write(key, value.detach());
            PropertyTree entry;
            entry.put("name", key);
            entry.add_child("shape", Detail::write_array(value.sizes().vec()));
            parameters.push_back({"", entry});
        }
        metadata.add_child("parameters", parameters);

        try {
            archive.save_to((staging / kParametersFile).string());
            if (optimizer != nullptr) {
                torch::serialize::OutputArchive optimizer_archive;
                optimizer->save(optimizer_archive);
                optimizer_archive.save_to((staging / kOptimizerFile).string());
            }
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to write checkpoint archives to '" + staging.string() + "': " + error.what());
        }
        write_json_file(staging / kMetadataFile, metadata);

        fs::remove_all(target);
        fs::rename(staging, target);
        Detail::replace_file(directory / kIndexFile, name);

        Utils::Terminal::Info(stream, "Saved checkpoint in '" + target.string() + "'");
        return target;
    }

    // Newest checkpoint under `directory`: the one the index names, else the highest step found.
    [[nodiscard]] inline std::optional<std::filesystem::path> latest_checkpoint(const std::filesystem::path& directory)
    {
        namespace fs = std::filesystem;
        std::error_code error;
        if (!fs::is_directory(directory, error)) {
            return std::nullopt;
        }

        const auto index = directory / kIndexFile;
        if (fs::is_regular_file(index, error)) {
            std::ifstream stream(index);
            std::string name;
            if (std::getline(stream, name) && !name.empty()) {
                const auto candidate = directory / name;
                if (Detail::step_of(candidate)) {
                    return candidate;
                }
            }
        }

        std::optional<fs::path> best;
        std::int64_t best_step = -1;
        for (const auto& entry : fs::directory_iterator(directory, error)) {
            if (!entry.is_directory() || entry.path().extension() == ".tmp") {
                continue;
            }
            if (const auto step = Detail::step_of(entry.path()); step && *step > best_step) {
                best_step = *step;
                best = entry.path();
            }
        }
        return best;
    }

    // Loads parameter values (and optimizer state when given) from a checkpoint directory.
    // Shape mismatches are fatal. Missing or unknown names are reported as warnings when
    // `partial_ok`, errors otherwise; the same holds for an unreadable optimizer archive.
    inline RestoreReport restore(const std::filesystem::path& path,
                                 torch::nn::Module& model,
                                 torch::optim::Optimizer* optimizer,
                                 bool partial_ok,
                                 std::ostream* stream = &std::cout)
    {
        namespace fs = std::filesystem;
        const auto parameters_path = path / kParametersFile;
        const auto metadata_path = path / kMetadataFile;
        if (!fs::exists(parameters_path) || !fs::exists(metadata_path)) {
            throw std::runtime_error("No checkpoint found at '" + path.string() + "'.");
        }

        RestoreReport report{};
        PropertyTree metadata;
        try {
            metadata = read_json_file(metadata_path);
        } catch (const std::exception& error) {
            throw std::runtime_error("Failed to read checkpoint metadata from '" + metadata_path.string()
                                     + "': " + error.what());
        }
        report.step = Detail::get_numeric<std::int64_t>(metadata, "step", metadata_path.string());

        torch::serialize::InputArchive archive;
        try {
            archive.load_from(parameters_path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to open parameter archive '" + parameters_path.string() + "': " + error.what());
        }

        const auto stored_keys = archive.keys();
        const std::set<std::string> available(stored_keys.begin(), stored_keys.end());
        auto state = Detail::named_state(model);

        // Validate every shape before touching the model.
        std::vector<std::pair<torch::Tensor, torch::Tensor>> assignments;
        std::set<std::string> known;
        for (const auto& [key, value] : state) {
            known.insert(key);
            if (!available.count(key)) {
                report.missing.push_back(key);
                continue;
            }
            torch::Tensor stored;
            archive.read(key, stored);
            if (!stored.defined() || stored.sizes() != value.sizes()) {
                throw std::runtime_error("Checkpoint variable '" + key + "' shape mismatch: expected "
                                         + format_shape(value) + " but found "
                                         + (stored.defined() ? format_shape(stored) : std::string("undefined")) + ".");
            }
            assignments.emplace_back(value, stored);
        }
        for (const auto& key : stored_keys) {
            if (!known.count(key)) {
                report.unexpected.push_back(key);
            }
        }

        if (!report.complete()) {
            std::string message = "Checkpoint '" + path.string() + "' matches the model only partially";
            if (!report.missing.empty()) {
                message += "; missing: " + Detail::join(report.missing);
            }
            if (!report.unexpected.empty()) {
                message += "; unexpected: " + Detail::join(report.unexpected);
            }
            if (!partial_ok) {
                throw std::runtime_error(message + ".");
            }
            Utils::Terminal::Warn(stream, message);
        }

        {
            torch::NoGradGuard no_grad;
            for (auto& [target, stored] : assignments) {
                target.copy_(stored);
            }
        }

        if (optimizer != nullptr) {
            const auto optimizer_path = path / kOptimizerFile;
            try {
                if (!fs::exists(optimizer_path)) {
                    throw std::runtime_error("no optimizer archive");
                }
                torch::serialize::InputArchive optimizer_archive;
                optimizer_archive.load_from(optimizer_path.string());
                optimizer->load(optimizer_archive);
                report.optimizer_restored = true;
            } catch (const std::exception& error) {
                if (!partial_ok) {
                    throw std::runtime_error("Failed to restore optimizer state from '" + path.string() + "': "
                                             + error.what());
                }
                Utils::Terminal::Warn(stream, "Optimizer state not restored from '" + path.string() + "' ("
                                              + error.what() + "); continuing with fresh moments.");
            }
        }

        Utils::Terminal::Info(stream, "Restored checkpoint '" + path.string() + "' at step "
                                      + std::to_string(report.step));
        return report;
    }
}
#endif // UGP_COMMON_SAVE_LOAD_HPP
