#include "conduit.hpp"
#include "conduit_desktop_utils.hpp"
#include "task_policies/conduit_desktop_tpolicy.hpp"
#include "logger/conduit_logger.hpp"
#include <iostream>
#include <string>
#include <thread>

// Stopwatch flow: a ticking generator, a formatter and a display sink.
// The flow is paused and resumed through a RootControlNode, then stopped.
int main() {
    conduit::LoggerConfig log_cfg;
    log_cfg.level = conduit::LOG_DEBUG;
    auto log_status = conduit::start_logging(log_cfg);
    if (log_status != conduit::LoggerStatus::Success) {
        std::cerr << "logger: " << conduit::to_str(log_status) << std::endl;
        return 1;
    }

    conduit::RuntimeRegistry registry;
    conduit::DesktopTaskPolicy policy;

    conduit::RuntimeOptions options;
    options.registry = &registry;

    options.id = "timer";
    auto timer = conduit::create_generator<int>("TimerEmitter",
        [tick = 0](conduit::GeneratorRuntime<int>::Emitter& out) mutable {
            out.delay(std::chrono::milliseconds(100));
            out.emit(++tick);
        }, options);

    options.id = "formatter";
    auto formatter = conduit::create_transformer<int, std::string>("Formatter",
        [](const int& tick) {
            const int seconds = tick / 10;
            return std::to_string(seconds / 60) + ":" + (seconds % 60 < 10 ? "0" : "") +
                   std::to_string(seconds % 60) + "." + std::to_string(tick % 10);
        }, options);

    options.id = "display";
    auto display = conduit::create_sink<std::string>("DisplayReceiver",
        [](const std::string& time) { std::cout << "\r" << time << std::flush; }, options);

    formatter->input_channel() = timer->output_channel();
    display->input_channel() = formatter->output_channel();

    conduit::FlowGraph graph;
    graph.id = "stopwatch";
    graph.name = "StopWatch";
    graph.root_nodes = {timer->node(), formatter->node(), display->node()};

    auto controller = conduit::RootControlNode::create_for(graph, "StopWatchController", &registry);

    if (display->start(policy).is_err() || formatter->start(policy).is_err() ||
        timer->start(policy).is_err()) {
        std::cerr << "failed to start the flow" << std::endl;
        return 1;
    }
    controller = controller.with_flow_graph(controller.start_all());

    std::this_thread::sleep_for(std::chrono::seconds(2));
    controller = controller.with_flow_graph(controller.pause_all());
    std::cout << std::endl;
    conduit::print_flow_status_report(controller);
    conduit::print_runtime_report(registry);

    std::this_thread::sleep_for(std::chrono::seconds(1));
    controller = controller.with_flow_graph(controller.resume_all());
    std::this_thread::sleep_for(std::chrono::seconds(2));

    controller = controller.with_flow_graph(controller.stop_all());
    std::cout << std::endl;
    conduit::print_flow_status_report(controller);
    return 0;
}
