// boost
#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/high_resolution_timer.hpp>
#include <boost/system/error_code.hpp>

// Abseil
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

// nlohmann_json
#include <nlohmann/json.hpp>
#include <nlohmann/json_fwd.hpp>

// standard
#include <system_error>
#include <string_view>
#include <filesystem>
#include <functional>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// local
#include "config-loader.hpp"

using namespace rubus;
using namespace std::chrono;

namespace {

    constexpr std::chrono::milliseconds PollPeriod = 500ms;

}

std::shared_ptr<ConfigHandler> ConfigHandler::configure(
    std::string_view configRootDirectory,
    std::shared_ptr<boost::asio::io_context> context
) {
    return std::make_shared<ConfigHandler>(configRootDirectory, std::move(context), Private());
}

ConfigHandler::ConfigHandler(
    std::string_view configRootDirectory, 
    std::shared_ptr<boost::asio::io_context> context,
    Private access
)
    : terminated_(false)
    , context_(std::move(context))
    , default_(ConfigFile{
        .filepath = absl::StrCat(configRootDirectory, "/default.cfg"),
        .lastUpdatedTs = {},
        .contents = nlohmann::json::object()
    })
    , dynamic_(ConfigFile{
        .filepath = absl::StrCat(configRootDirectory, "/dynamic.cfg"),
        .lastUpdatedTs = {},
        .contents = nlohmann::json::object()
    })
{}

absl::Status ConfigHandler::init() {
    absl::Status status = absl::FailedPreconditionError("config handler is already initialized");
    std::call_once(init_, [this, &status]() {
        std::unique_lock<std::mutex> locked(lock_);
        status = parseConfig(default_);
        status.Update(parseConfig(dynamic_));
        if (!status.ok()) {
            return;
        }

        std::error_code error;
        dynamic_.lastUpdatedTs = std::filesystem::last_write_time(dynamic_.filepath, error);
        default_.lastUpdatedTs = std::filesystem::last_write_time(default_.filepath, error);
        locked.unlock();

        PLOG(plog::info) << "[config] loaded " << default_.filepath.string() << " and " << dynamic_.filepath.string();
        schedule();
    });

    return status;
}

void ConfigHandler::terminate() {
    {
        std::unique_lock<std::mutex> locked(lock_);
        if (terminated_) {
            return;
        }
        terminated_ = true;
    }

    // timer may only be touched from context
    boost::asio::post(*context_, [weak = weak_from_this()]() {
        if (auto self = weak.lock(); self && self->timer_) {
            self->timer_->cancel();
        }
    });
}

void ConfigHandler::schedule() {
    boost::asio::post(*context_, [weak = weak_from_this()]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }

        {
            std::unique_lock<std::mutex> locked(self->lock_);
            if (self->terminated_) {
                return;
            }
        }

        self->timer_ = std::make_unique<boost::asio::high_resolution_timer>(*self->context_, PollPeriod);
        self->timer_->async_wait([weak](boost::system::error_code error) {
            if (auto self = weak.lock()) {
                self->poll(error);
            }
        });
    });
}

void ConfigHandler::poll(boost::system::error_code error) {
    if (error == boost::asio::error::operation_aborted) {
        return;
    }
    if (error) {
        PLOG(plog::error) << "[config] error on scheduled config update call: " << error.message();
        return;
    }

    std::error_code fsError;
    auto updatedTs = std::filesystem::last_write_time(dynamic_.filepath, fsError);

    if (!fsError && updatedTs > dynamic_.lastUpdatedTs) {
        std::vector<Subscriber> subscribers;
        nlohmann::json contents;
        absl::Status status;
        {
            std::unique_lock<std::mutex> locked(lock_);
            dynamic_.lastUpdatedTs = updatedTs;
            status = parseConfig(dynamic_);
            subscribers = dynamicConfigSubscribers_;
            contents = dynamic_.contents;
        }

        if (status.ok()) {
            PLOG(plog::info) << "[config] dynamic config changed, notifying " << subscribers.size() << " subscribers";
            for (const auto& sub : subscribers) {
                notify(sub, contents);
            }
        } else {
            PLOG(plog::warning) << "[config] error while updating config: " << status.message() << "; keeping previous values";
        }
    }

    schedule();
}

absl::Status ConfigHandler::parseConfig(ConfigFile& config) {
    std::ifstream ifs {config.filepath, std::ios::in | std::ios::binary};
    if (!ifs) {
        return absl::NotFoundError(absl::StrFormat(
            "error while opening config file: %s, ensure that it exists", config.filepath.string()));
    }

    std::string jsonString;
    std::size_t configFileSize = std::filesystem::file_size(config.filepath);
    jsonString.resize(configFileSize);

    if (static_cast<std::size_t>(ifs.read(jsonString.data(), configFileSize).gcount()) < configFileSize) {
        return absl::InternalError("error while reading file: not all bytes received");
    }

    auto contents = nlohmann::json::parse(jsonString, nullptr, false);
    if (contents.is_discarded() || !contents.is_object()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "error while parsing json in %s, ensure that config is correct", config.filepath.string()));
    }

    config.contents = std::move(contents);
    return absl::OkStatus();
}

nlohmann::json ConfigHandler::defaultSection(const std::string& section) {
    std::unique_lock<std::mutex> locked(lock_);
    if (default_.contents.contains(section)) {
        return default_.contents[section];
    }
    return nlohmann::json::object();
}

void ConfigHandler::notify(const Subscriber& sub, const nlohmann::json& config) {
    if (sub.lifetime.lock()) {
        sub.callback((config.contains(sub.section)) ? config[sub.section] : nlohmann::json::object());
    }
}

void ConfigHandler::subscribeOnDefaultConfig(
    const std::string& section, 
    std::function<void(const nlohmann::json&)> callback, 
    std::weak_ptr<void> lifetime) 
{
    Subscriber subscriber {
        .section = section,
        .callback = std::move(callback),
        .lifetime = std::move(lifetime)
    };
    nlohmann::json contents;
    {
        std::unique_lock<std::mutex> locked(lock_);
        defaultConfigSubscribers_.push_back(subscriber);
        contents = default_.contents;
    }
    notify(subscriber, contents);
}

void ConfigHandler::subscribeOnDynamicConfig(
    const std::string& section, 
    std::function<void(const nlohmann::json&)> callback, 
    std::weak_ptr<void> lifetime)
{
    Subscriber subscriber {
        .section = section,
        .callback = std::move(callback),
        .lifetime = std::move(lifetime)
    };
    nlohmann::json contents;
    {
        std::unique_lock<std::mutex> locked(lock_);
        dynamicConfigSubscribers_.push_back(subscriber);
        contents = dynamic_.contents;
    }
    notify(subscriber, contents);
}
