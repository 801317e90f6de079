#include "platform/linux/recording_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <string>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

RecordingLoop::RecordingLoop(const Config& config, bool verbose)
    : verbose_(verbose), visualize_(config.audio.visualize),
      ring_buf_(config.audio.ring_buffer_samples()),
      audio_capture_(ring_buf_, CaptureFormat{config.audio.sample_rate, config.audio.channels}),
      session_(ring_buf_, audio_capture_, config.audio.capture(), config.quality,
               config.audio.post_process()) {}

RecordingLoop::~RecordingLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool RecordingLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Ticks at the faster of the two feed rates; the session schedules each feed itself.
    auto cfg = session_.config();
    double hz = std::max({cfg.quality_check_hz, cfg.visualize ? cfg.visualization_hz : 0.0, 1.0});
    auto interval_ns = static_cast<long>(std::llround(1e9 / hz));

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec spec{};
    spec.it_interval.tv_sec = interval_ns / 1'000'000'000L;
    spec.it_interval.tv_nsec = interval_ns % 1'000'000'000L;
    spec.it_value = spec.it_interval;
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    // stdin may be a file or /dev/null when not interactive; signals still stop the loop.
    if (!add_fd(STDIN_FILENO, EPOLLIN)) {
        log("stdin not pollable, use Ctrl-C to stop");
    }

    return true;
}

std::expected<EncodedAudio, CoachError> RecordingLoop::run() {
    auto started = session_.start();
    if (!started) return std::unexpected(started.error());

    std::println(stderr, "Recording... press Enter to stop, p + Enter to pause/resume");
    running_.store(true, std::memory_order_release);

    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, stopping");
                }
                result_ = finish();
                continue;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {
                    on_timer();
                }
                continue;
            }

            if (fd == STDIN_FILENO) {
                on_stdin();
            }
        }
    }

    if (!result_) result_ = finish();
    if (visualize_) std::println(stderr, "");
    return std::move(*result_);
}

void RecordingLoop::on_stdin() {
    char buf[64];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
        // EOF on stdin: stop reading it, keep recording until a signal or the limit.
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, STDIN_FILENO, nullptr);
        return;
    }

    std::string line(buf, static_cast<size_t>(n));
    if (line.find('p') != std::string::npos) {
        auto toggled = session_.status() == RecordingStatus::Paused ? session_.resume() : session_.pause();
        if (!toggled) {
            log(toggled.error().message);
        } else {
            std::println(stderr, "\n{}", session_.status() == RecordingStatus::Paused ? "Paused" : "Resumed");
        }
        return;
    }

    result_ = finish();
}

void RecordingLoop::on_timer() {
    auto ticked = session_.tick();

    while (auto quality = session_.next_quality()) report_quality(*quality);
    while (auto frame = session_.next_frame()) last_frame_ = std::move(*frame);
    if (visualize_ && session_.status() == RecordingStatus::Recording) draw_meter();

    if (session_.status() != RecordingStatus::Completed) return;

    // Reached the duration limit.
    log(std::format("Maximum duration reached ({:.0f}s)", session_.config().max_seconds));
    if (ticked) {
        result_ = *session_.state().recording;
    } else if (auto raw = session_.raw_recording()) {
        log("Post-processing failed, keeping uncompressed audio: " + ticked.error().message);
        result_ = std::move(*raw);
    } else {
        result_ = std::unexpected(ticked.error());
    }
    running_.store(false, std::memory_order_release);
}

void RecordingLoop::report_quality(const QualityInfo& info) {
    if (info.issues == last_issues_) return;
    last_issues_ = info.issues;

    if (info.is_good) {
        log("Audio quality ok");
        return;
    }
    std::string issues;
    for (auto issue : info.issues) {
        if (!issues.empty()) issues += ", ";
        issues += to_string(issue);
    }
    std::println(stderr, "\nWarning: {} (volume {}, noise {})", issues, info.volume_level, info.noise_level);
}

void RecordingLoop::draw_meter() {
    if (!last_frame_) return;
    constexpr int width = 30;
    int filled = std::clamp(last_frame_->volume_level * width / 100, 0, width);
    std::print(stderr, "\r{:6.1f}s [{}{}]", session_.elapsed_seconds(),
               std::string(static_cast<size_t>(filled), '#'),
               std::string(static_cast<size_t>(width - filled), ' '));
}

std::expected<EncodedAudio, CoachError> RecordingLoop::finish() {
    running_.store(false, std::memory_order_release);

    auto encoded = session_.stop();
    if (auto dropped = audio_capture_.overruns(); dropped > 0) {
        log(std::format("Ring buffer overran, {} samples dropped", dropped));
    }
    if (encoded) return encoded;

    if (encoded.error().code == ErrorCode::EncodingError) {
        if (auto raw = session_.raw_recording()) {
            log("Post-processing failed, keeping uncompressed audio: " + encoded.error().message);
            return std::move(*raw);
        }
    }
    return std::unexpected(encoded.error());
}

void RecordingLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[speak-coach] {}", msg);
    }
}
