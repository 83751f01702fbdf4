#pragma once

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

class PropertyStore;

// ---------------------------------------------------------------------------
// ConfigWatcher
//   YAML 설정 파일의 수정 시각을 주기적으로 확인하고, 바뀌면 다시 로드해
//   PropertyStore 에 반영한다.
//
//   - 파싱 실패 시 store 를 건드리지 않고 경고만 남긴다 (기존 설정 유지).
//     같은 내용으로 재시도하지 않으며 파일이 다시 바뀔 때 재로드한다.
//   - run() 시작 시점의 수정 시각을 기준으로 삼는다. 최초 로드는 호출자 몫.
//   - stop() 은 다른 스레드에서 호출해도 된다.
// ---------------------------------------------------------------------------
class ConfigWatcher {
public:
    // -----------------------------------------------------------------------
    // 생성자
    //   config_path : 감시할 YAML 파일
    //   store       : 재로드 결과를 기록할 저장소 (watcher 보다 오래 살아야 함)
    //   io_context  : 타이머 코루틴 실행에 사용
    //   interval    : 폴링 주기
    // -----------------------------------------------------------------------
    ConfigWatcher(std::filesystem::path     config_path,
                  PropertyStore&            store,
                  boost::asio::io_context&  io_context,
                  std::chrono::milliseconds interval = std::chrono::milliseconds{1000});

    ~ConfigWatcher() = default;

    ConfigWatcher(const ConfigWatcher&)            = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;
    ConfigWatcher(ConfigWatcher&&)                 = delete;
    ConfigWatcher& operator=(ConfigWatcher&&)      = delete;

    // run
    //   io_context 에서 co_spawn 하여 실행한다. stop() 또는 io_context 종료 시 반환.
    auto run() -> boost::asio::awaitable<void>;

    void stop();

    [[nodiscard]] std::uint64_t reload_count() const noexcept {
        return reload_count_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::uint64_t failure_count() const noexcept {
        return failure_count_.load(std::memory_order_acquire);
    }

private:
    [[nodiscard]] std::optional<std::filesystem::file_time_type> current_write_time() const;
    void reload();

    std::filesystem::path     config_path_;
    PropertyStore&            store_;
    boost::asio::io_context&  io_context_;
    std::chrono::milliseconds interval_;
    boost::asio::steady_timer timer_;
    std::atomic<bool>         stopped_{false};
    std::atomic<std::uint64_t> reload_count_{0};
    std::atomic<std::uint64_t> failure_count_{0};
};
