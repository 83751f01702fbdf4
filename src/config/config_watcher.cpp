#include "config/config_watcher.hpp"

#include "config/config_loader.hpp"
#include "config/property_store.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

ConfigWatcher::ConfigWatcher(std::filesystem::path     config_path,
                             PropertyStore&            store,
                             boost::asio::io_context&  io_context,
                             std::chrono::milliseconds interval)
    : config_path_{std::move(config_path)}
    , store_{store}
    , io_context_{io_context}
    , interval_{interval}
    , timer_{io_context}
{}

std::optional<std::filesystem::file_time_type> ConfigWatcher::current_write_time() const {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        return std::nullopt;
    }
    return mtime;
}

void ConfigWatcher::reload() {
    auto loaded = ConfigLoader::load(config_path_);
    if (!loaded.has_value()) {
        failure_count_.fetch_add(1, std::memory_order_acq_rel);
        spdlog::warn("[config_watcher] reload of '{}' failed, keeping previous settings: {}",
                     config_path_.string(), loaded.error());
        return;
    }

    const auto applied = ConfigLoader::apply(*loaded, store_);
    reload_count_.fetch_add(1, std::memory_order_acq_rel);
    spdlog::info("[config_watcher] reloaded '{}' ({} properties applied)",
                 config_path_.string(), applied);
}

auto ConfigWatcher::run() -> boost::asio::awaitable<void>
{
    auto last_seen = current_write_time();
    spdlog::info("[config_watcher] watching '{}' every {}ms",
                 config_path_.string(), interval_.count());

    while (!stopped_.load(std::memory_order_acquire)) {
        timer_.expires_after(interval_);

        boost::system::error_code ec;
        co_await timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec == boost::asio::error::operation_aborted ||
            stopped_.load(std::memory_order_acquire)) {
            break;
        }
        if (ec) {
            spdlog::warn("[config_watcher] timer error: {}", ec.message());
            continue;
        }

        const auto now_seen = current_write_time();
        if (now_seen == last_seen) {
            continue;
        }
        last_seen = now_seen;

        if (!now_seen.has_value()) {
            spdlog::warn("[config_watcher] '{}' disappeared, keeping previous settings",
                         config_path_.string());
            continue;
        }
        reload();
    }

    spdlog::info("[config_watcher] stopped");
}

void ConfigWatcher::stop()
{
    stopped_.store(true, std::memory_order_release);
    // 타이머 취소는 io_context 스레드에서 수행
    boost::asio::post(io_context_, [this] { timer_.cancel(); });
}
