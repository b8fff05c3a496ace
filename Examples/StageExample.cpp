//
// Nested stages driven through their whole lifecycle, cancelled by a deadline.
//

#include <OrchestraCore.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Orchestra;
using namespace Core;
using namespace Core::Logging;
using namespace std::chrono_literals;

// Fills a buffer of samples until asked to stop
class SamplerPlayer : public Player {
public:
    explicit SamplerPlayer(size_t capacity) : _capacity(capacity) {}

    void setup() override {
        _samples.reserve(_capacity);
        ORCHESTRA_LOG_INFO_CAT("Sampler", "Reserved " + std::to_string(_capacity) + " samples");
    }

    void play(std::stop_token token) override {
        while (!token.stop_requested() && _samples.size() < _capacity) {
            _samples.push_back(_samples.size());
            std::this_thread::sleep_for(10ms);
        }
        ORCHESTRA_LOG_INFO_CAT("Sampler", "Collected " + std::to_string(_samples.size()) + " samples");
    }

    void clean() noexcept override {
        _samples.clear();
        _samples.shrink_to_fit();
    }

private:
    size_t _capacity;
    std::vector<size_t> _samples;
};

int main() {
    Logger::global().setMinLevel(LogLevel::Info);

    std::atomic<int> ticks{0};

    auto workers = std::make_unique<Stage>(StageConfig{.name = "Workers", .enableDebugLogging = true});
    workers->add("sampler", std::make_unique<SamplerPlayer>(1000));
    workers->add("ticker", [&ticks](std::stop_token token) {
        while (!token.stop_requested()) {
            ticks.fetch_add(1, std::memory_order_relaxed);
            std::this_thread::sleep_for(50ms);
        }
    });

    Stage root({.name = "Root"});
    root.add("workers", std::move(workers));
    root.add("flaky", [](std::stop_token token) {
        std::this_thread::sleep_for(100ms);
        if (!token.stop_requested()) {
            throw std::runtime_error("lost connection");
        }
    });

    try {
        root.setup();
    } catch (const SetupError& e) {
        ORCHESTRA_LOG_ERROR_CAT("StageExample", e.what());
        return 1;
    }

    std::stop_source stop;
    std::thread deadline([&stop] {
        std::this_thread::sleep_for(300ms);
        ORCHESTRA_LOG_INFO_CAT("StageExample", "Deadline reached, requesting stop");
        stop.request_stop();
    });

    int exitCode = 0;
    try {
        root.play(stop.get_token());
    } catch (const PlayError& e) {
        ORCHESTRA_LOG_WARNING_CAT("StageExample", e.what());
        exitCode = e.contains("flaky") && e.failures().size() == 1 ? 0 : 1;
    }

    deadline.join();
    root.clean();

    ORCHESTRA_LOG_INFO_CAT("StageExample", "Ticker ran " + std::to_string(ticks.load()) + " times, final state " +
                                               toString(root.state()));
    return exitCode;
}
