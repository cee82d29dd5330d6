/**
 * @file config_loader.cpp
 * @brief Defaults + JSON overrides via nlohmann::json.
 */
#include "vox/config/config_loader.hpp"
#include "vox/os/memory.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace vox::config {
    using namespace vox::config::constants;
    using json = nlohmann::json;

    namespace {

        bool set_size(const json& v, std::size_t& out, std::size_t min) {
            if (!v.is_number_unsigned()) return false;
            const auto n = v.get<std::uint64_t>();
            if (n < min) return false;
            out = static_cast<std::size_t>(n);
            return true;
        }

        bool set_ratio(const json& v, double& out) {
            if (!v.is_number()) return false;
            const double d = v.get<double>();
            if (!(d > 0.0 && d <= 1.0)) return false;
            out = d;
            return true;
        }

        using Setter = std::function<bool(PipelineConfig&, const json&)>;

        const std::unordered_map<std::string_view, Setter>& setters() {
            static const std::unordered_map<std::string_view, Setter> table = {
                {"cache.capacity", [](PipelineConfig& c, const json& v) {
                    if (v.is_string() && v.get<std::string>() == "auto") {
                        const auto mem = os::query_system_memory();
                        c.cache.capacity = mem ? optimal_cache_size(mem->total) : CACHE_DEFAULT_CAPACITY;
                        return true;
                    }
                    return set_size(v, c.cache.capacity, 1);
                }},
                {"cache.high_watermark", [](PipelineConfig& c, const json& v) {
                    return set_ratio(v, c.cache.thresholds.high);
                }},
                {"cache.critical_watermark", [](PipelineConfig& c, const json& v) {
                    return set_ratio(v, c.cache.thresholds.critical);
                }},
                {"cache.reclaim_hint", [](PipelineConfig& c, const json& v) {
                    c.cache.reclaim_hint = v.get<bool>();   // type_error on anything but a bool
                    return true;
                }},
                {"pool.max_size", [](PipelineConfig& c, const json& v) {
                    return set_size(v, c.pool.max_size, 0);
                }},
                {"decoder.buffer_bytes", [](PipelineConfig& c, const json& v) {
                    return set_size(v, c.decoder.buffer_bytes, 16);
                }},
                {"decoder.max_depth", [](PipelineConfig& c, const json& v) {
                    return set_size(v, c.decoder.max_depth, 1);
                }},
                {"buffer.maintenance_ratio", [](PipelineConfig& c, const json& v) {
                    return set_ratio(v, c.buffer.maintenance_ratio);
                }},
            };
            return table;
        }

        vox_detail::expected<PipelineConfig, ConfigError> apply(const json& root) {
            if (!root.is_object()) {
                return vox_detail::unexpected<ConfigError>(
                    ConfigError{ConfigErrc::Malformed, "", std::string("top level is ") + root.type_name() + ", expected object"});
            }

            PipelineConfig cfg = Loader::defaults();
            for (const auto& [section, body] : root.items()) {
                if (!body.is_object()) {
                    return vox_detail::unexpected<ConfigError>(
                        ConfigError{ConfigErrc::Malformed, section, "section '" + section + "' is not an object"});
                }
                for (const auto& [name, value] : body.items()) {
                    const std::string key = section + "." + name;
                    const auto it = setters().find(key);
                    if (it == setters().end()) {
                        return vox_detail::unexpected<ConfigError>(
                            ConfigError{ConfigErrc::UnknownKey, key, "unknown key '" + key + "'"});
                    }
                    bool ok = false;
                    try {
                        ok = it->second(cfg, value);
                    } catch (const json::type_error& e) {
                        return vox_detail::unexpected<ConfigError>(
                            ConfigError{ConfigErrc::InvalidValue, key, key + ": " + e.what()});
                    }
                    if (!ok) {
                        return vox_detail::unexpected<ConfigError>(
                            ConfigError{ConfigErrc::InvalidValue, key, "bad value " + value.dump() + " for " + key});
                    }
                }
            }

            if (!(cfg.cache.thresholds.high < cfg.cache.thresholds.critical)) {
                return vox_detail::unexpected<ConfigError>(
                    ConfigError{ConfigErrc::InvalidValue, "cache.high_watermark",
                                "cache.high_watermark must be below cache.critical_watermark"});
            }
            return cfg;
        }

    } // namespace

    const char* to_string(ConfigErrc code) noexcept {
        switch (code) {
            case ConfigErrc::FileNotFound: return "file_not_found";
            case ConfigErrc::Malformed:    return "malformed";
            case ConfigErrc::UnknownKey:   return "unknown_key";
            case ConfigErrc::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    std::size_t optimal_cache_size(std::uint64_t available_bytes) noexcept {
        const std::uint64_t share = available_bytes / CACHE_MEMORY_SHARE_DIV;
        const std::uint64_t fit   = share / CACHE_EST_CHUNK_BYTES;
        return static_cast<std::size_t>(std::clamp<std::uint64_t>(fit, CACHE_MIN_AUTO_CAPACITY,
                                                                  CACHE_MAX_AUTO_CAPACITY));
    }

    PipelineConfig Loader::defaults() {
        return PipelineConfig{}; // every field picks its default from constants
    }

    vox_detail::expected<PipelineConfig, ConfigError> Loader::load_from_string(const std::string& text) {
        json root;
        try {
            root = json::parse(text);
        } catch (const json::parse_error& e) {
            return vox_detail::unexpected<ConfigError>(ConfigError{ConfigErrc::Malformed, "", e.what()});
        }
        return apply(root);
    }

    vox_detail::expected<PipelineConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return vox_detail::unexpected<ConfigError>(
                ConfigError{ConfigErrc::FileNotFound, "", "cannot open " + path});
        }
        json root;
        try {
            root = json::parse(in);
        } catch (const json::parse_error& e) {
            return vox_detail::unexpected<ConfigError>(
                ConfigError{ConfigErrc::Malformed, "", "invalid JSON in " + path + ": " + e.what()});
        }
        return apply(root);
    }

} // namespace vox::config
