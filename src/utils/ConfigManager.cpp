#include <fmt/format.h>

#include <algorithm>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "CommandLine.hpp"
#include "ConfigManager.hpp"
#include "Env.hpp"
#include "libfs.hpp"

#include <AbslLogCompat.hpp>

namespace po = boost::program_options;

namespace {

template <typename T, ConfigManager::Configs config>
void AddOption(po::options_description &desc) {
    auto index = std::ranges::find_if(ConfigManager::kConfigMap,
                                      [](const ConfigManager::Entry &entry) {
                                          return entry.config == config;
                                      });
    const std::string name =
        index->alias != ConfigManager::Entry::ALIAS_NONE
            ? fmt::format("{},{}", index->name, index->alias)
            : std::string(index->name);
    if constexpr (std::is_same_v<T, void>) {
        desc.add_options()(name.c_str(), index->description.data());
    } else {
        desc.add_options()(name.c_str(), po::value<T>(),
                           index->description.data());
    }
}

struct ConfigBackendEnv : public ConfigManager::Backend {
    ~ConfigBackendEnv() override = default;
    ConfigBackendEnv() = default;

    std::optional<std::string> get(const std::string_view name) override {
        Env env;
        if (env[name].has()) {
            return env[name].get();
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

template <ConfigManager::Entry::ArgType type>
struct ArgTypeDeducer {};

template <>
struct ArgTypeDeducer<ConfigManager::Entry::ArgType::STRING> {
    using Type = std::string;
};

template <>
struct ArgTypeDeducer<ConfigManager::Entry::ArgType::NONE> {
    using Type = void;
};

template <ConfigManager::Configs config>
void verifyUniqueConfig() {
    constexpr auto count = std::ranges::count_if(
        ConfigManager::kConfigMap,
        [](const auto &entry) { return entry.config == config; });
    static_assert(count == 1,
                  "kConfigMap must and only contain one of each configs");
}

template <size_t index>
void addIndexConfig(po::options_description &desc) {
    constexpr auto config = static_cast<ConfigManager::Configs>(index);

    // HELP is only meaningful on the command line.
    if constexpr (config == ConfigManager::Configs::HELP ||
                  config == ConfigManager::Configs::MAX) {
        return;
    } else {
        constexpr auto argtype =
            std::ranges::find_if(ConfigManager::kConfigMap,
                                 [](const auto &entry) {
                                     return entry.config == config;
                                 })
                ->type;
        verifyUniqueConfig<config>();
        using ArgType = typename ArgTypeDeducer<argtype>::Type;
        AddOption<ArgType, config>(desc);
    }
}

template <size_t... index>
void addAll(po::options_description &desc,
            const std::index_sequence<index...> /*indexes*/) {
    (addIndexConfig<index>(desc), ...);
}

struct ConfigBackendBoostPOBase : public ConfigManager::Backend {
    static po::options_description getOptionsDesc() {
        po::options_description desc("PollBot Configs");
        addAll(desc, std::make_index_sequence<ConfigManager::CONFIG_MAX>());
        return desc;
    }

    std::optional<std::string> get(const std::string_view name) override {
        const auto it = mp.find(std::string(name));
        if (it == mp.end()) {
            return std::nullopt;
        }
        // Flags carry no value
        if (it->second.value().type() != typeid(std::string)) {
            return std::string();
        }
        return it->second.as<std::string>();
    }

    ConfigBackendBoostPOBase() = default;
    ~ConfigBackendBoostPOBase() override = default;

   protected:
    po::variables_map mp;
};

struct ConfigBackendFile : public ConfigBackendBoostPOBase {
    bool load() override {
        std::filesystem::path home;

        if (!FS::getHomePath(home)) {
            LOG(WARNING) << "Cannot determine home directory";
            return false;
        }

        const auto confPath = home / ConfigManager::kConfigFileName;
        std::ifstream ifs(confPath);
        if (ifs.fail()) {
            DLOG(INFO) << "Opening " << confPath << " failed";
            return false;
        }
        try {
            po::store(po::parse_config_file(ifs, getOptionsDesc()), mp);
            po::notify(mp);
        } catch (const po::error &e) {
            LOG(ERROR) << "File backend failed to parse: " << e.what();
            return false;
        }

        LOG(INFO) << "Loaded " << mp.size() << " entries from " << confPath;
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "File"; }

    ConfigBackendFile() = default;
    ~ConfigBackendFile() override = default;
};

struct ConfigBackendCmdline : public ConfigBackendBoostPOBase {
    CommandLine _line;

    static po::options_description getOptionsDesc() {
        auto desc = ConfigBackendBoostPOBase::getOptionsDesc();

        AddOption<void, ConfigManager::Configs::HELP>(desc);
        return desc;
    }

    bool load() override {
        try {
            po::store(po::parse_command_line(_line.argc(), _line.argv(),
                                             getOptionsDesc()),
                      mp);
            po::notify(mp);
        } catch (const po::error &e) {
            LOG(ERROR) << "Cmdline backend failed to parse: " << e.what();
            return false;
        }

        LOG(INFO) << "Loaded " << mp.size() << " entries (cmdline)";
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

    explicit ConfigBackendCmdline(CommandLine line) : _line(std::move(line)) {}
    ~ConfigBackendCmdline() override = default;
};

std::string_view nameOf(const ConfigManager::Configs config) {
    return std::ranges::find_if(ConfigManager::kConfigMap,
                                [config](const ConfigManager::Entry &entry) {
                                    return entry.config == config;
                                })
        ->name;
}

}  // namespace

ConfigManager::ConfigManager(CommandLine line) {
    auto cmdline = std::make_unique<ConfigBackendCmdline>(std::move(line));
    if (cmdline->load()) {
        helpRequested_ = cmdline->get(nameOf(Configs::HELP)).has_value();
        backends_.emplace_back(std::move(cmdline));
    }
    auto env = std::make_unique<ConfigBackendEnv>();
    if (env->load()) {
        backends_.emplace_back(std::move(env));
    }
    auto file = std::make_unique<ConfigBackendFile>();
    if (file->load()) {
        backends_.emplace_back(std::move(file));
    }
    DLOG(INFO) << "Loaded " << backends_.size() << " config sources";
}

ConfigManager::ConfigManager(std::vector<std::unique_ptr<Backend>> backends)
    : backends_(std::move(backends)) {
    for (const auto &backend : backends_) {
        if (backend->get(nameOf(Configs::HELP))) {
            helpRequested_ = true;
        }
    }
}

std::optional<std::string> ConfigManager::get(Configs config) {
    const std::string_view name = nameOf(config);

    for (const auto &bit : backends_) {
        if (!bit) {
            continue;
        }
        const auto &result = bit->get(name);
        if (result.has_value()) {
            DLOG(INFO) << fmt::format("Used '{}' backend for variable {}",
                                      bit->name(), name);
            return result;
        }
    }

    return std::nullopt;
}

void ConfigManager::serializeHelpToOStream(std::ostream &out) {
    out << ConfigBackendCmdline::getOptionsDesc() << std::endl;
}
