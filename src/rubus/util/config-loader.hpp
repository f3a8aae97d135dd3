#pragma once

// boost
#include <boost/asio/io_context.hpp>
#include <boost/asio/high_resolution_timer.hpp>

// Abseil
#include <absl/status/status.h>

// nlohmann_json
#include <nlohmann/json.hpp>
#include <nlohmann/json_fwd.hpp>

// standard
#include <mutex>
#include <vector>
#include <memory>
#include <functional>
#include <filesystem>
#include <string_view>


namespace rubus {

    // Reads default.cfg and dynamic.cfg (json) from runtime directory. Subscribers
    // receive their section immediately, dynamic subscribers also receive it
    // after every change of dynamic.cfg, which is polled on io_context.
    class ConfigHandler
        : public std::enable_shared_from_this<ConfigHandler> {
    private: struct Private { };
    public:

        static std::shared_ptr<ConfigHandler> configure(
            std::string_view configRootDirectory,
            std::shared_ptr<boost::asio::io_context> context
        );
        ConfigHandler(
            std::string_view configRootDirectory, 
            std::shared_ptr<boost::asio::io_context> context,
            Private access
        );

        absl::Status init();
        // stops polling of dynamic config
        void terminate();

        // Section of default config, empty object if it is absent.
        nlohmann::json defaultSection(const std::string& section);

        void subscribeOnDefaultConfig(const std::string& section, std::function<void(const nlohmann::json&)> callback, std::weak_ptr<void> lifetime);
        void subscribeOnDynamicConfig(const std::string& section, std::function<void(const nlohmann::json&)> callback, std::weak_ptr<void> lifetime);

    private:

        struct ConfigFile {
            std::filesystem::path filepath;
            std::filesystem::file_time_type lastUpdatedTs;
            nlohmann::json contents;
        };

        struct Subscriber {
            std::string section;
            std::function<void(const nlohmann::json&)> callback;
            std::weak_ptr<void> lifetime;
        };

        void schedule();
        void poll(boost::system::error_code error);

        void notify(const Subscriber& sub, const nlohmann::json& config);
        absl::Status parseConfig(ConfigFile& config);

    private:
        std::mutex lock_;
        std::once_flag init_;
        bool terminated_;

        std::shared_ptr<boost::asio::io_context> context_;
        std::unique_ptr<boost::asio::high_resolution_timer> timer_;

        ConfigFile default_;
        ConfigFile dynamic_;

        std::vector<Subscriber> defaultConfigSubscribers_;
        std::vector<Subscriber> dynamicConfigSubscribers_;
    };

}
