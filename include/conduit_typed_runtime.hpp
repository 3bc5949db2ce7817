#pragma once

#include "conduit_channel.hpp"
#include "conduit_error.hpp"
#include "conduit_process_result.hpp"
#include "conduit_runtime.hpp"
#include "zf_log.h"
#include <array>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace conduit {

    template<typename... Ts>
    struct Inputs {
        static constexpr std::size_t size = sizeof...(Ts);
    };

    template<typename... Ts>
    struct Outputs {
        static constexpr std::size_t size = sizeof...(Ts);
    };

    namespace detail {
        // What a processing function returns for a given output list
        template<typename... Outs> struct process_output;
        template<> struct process_output<> { using type = void; };
        template<typename A> struct process_output<A> { using type = std::optional<A>; };
        template<typename A, typename B> struct process_output<A, B> { using type = ProcessResult2<A, B>; };
        template<typename A, typename B, typename C> struct process_output<A, B, C> { using type = ProcessResult3<A, B, C>; };
    } // namespace detail

    template<typename InputList, typename OutputList>
    class TypedNodeRuntime;

    // One runtime shape for every (inputs x outputs) combination from 0..3 x 0..3,
    // except 0 x 0. The processing function receives one value per input (a join
    // across all inputs) and returns:
    //   nothing                      for 0 outputs
    //   std::optional<R> (or R)      for 1 output, empty skips the send
    //   ProcessResult2 / 3           for 2 / 3 outputs, empty slots are skipped
    // Generators (0 inputs) get an Emitter instead and are re-invoked every cycle.
    //
    // Output channels are created by the runtime and closed when its loop exits.
    // Input channels are the upstream runtimes' output channels and must be wired
    // before start(). A restarted runtime replaces outputs closed by its previous
    // run, so downstream inputs need to be wired again after a restart.
    template<typename... Ins, typename... Outs>
    class TypedNodeRuntime<Inputs<Ins...>, Outputs<Outs...>> : public NodeRuntime {
    public:
        static constexpr std::size_t input_count = sizeof...(Ins);
        static constexpr std::size_t output_count = sizeof...(Outs);

        static_assert(input_count + output_count >= 1, "A runtime needs at least one input or one output");
        static_assert(input_count <= 3, "At most three inputs are supported");
        static_assert(output_count <= 3, "At most three outputs are supported");

        using output_type = typename detail::process_output<Outs...>::type;

        class Emitter;

        using process_function = std::conditional_t<input_count == 0,
            std::function<void(Emitter&)>,
            std::function<output_type(const Ins&...)>>;

        // Handed to generators. Emitting waits while the runtime is paused.
        class Emitter {
        public:
            explicit Emitter(TypedNodeRuntime& runtime) : _runtime(runtime) {}

            // Sends one value (or ProcessResult) on the outputs.
            // Returns false once the runtime is stopping or an output was closed.
            template<typename R>
            bool emit(R&& value) {
                if (_closed) return false;
                if (!_runtime.wait_while_paused()) return false;
                const output_type out(std::forward<R>(value));
                if (!_runtime.send_outputs(out)) {
                    _closed = true;
                    return false;
                }
                return true;
            }

            template<typename Rep, typename Period>
            void delay(const std::chrono::duration<Rep, Period>& duration) {
                this_task::sleep_for(duration);
            }

            bool closed() const { return _closed; }
            bool is_active() const { return !_closed && !_runtime.is_idle(); }

        private:
            TypedNodeRuntime& _runtime;
            bool _closed = false;
        };

        TypedNodeRuntime(CodeNode node, process_function process,
                         const std::vector<int>& output_capacities = {},
                         RuntimeRegistry* registry = nullptr,
                         RuntimeConfig config = RuntimeConfig{})
            : NodeRuntime(std::move(node), registry, config),
              _process(std::move(process)),
              _capacities(resolve_capacities(output_capacities, config)) {
            if (!_process) {
                throw std::invalid_argument("Processing function for node '" + name() + "' is empty.");
            }
            renew_outputs(std::index_sequence_for<Outs...>{});
        }

        ~TypedNodeRuntime() override {
            // the task uses members of this class, stop it before they go away
            stop();
        }

        // Stops any previous run, replaces closed outputs and schedules the loop.
        Result<Empty, Error> start(TaskPolicyBase& policy) {
            stop();
            if (!inputs_wired(std::index_sequence_for<Ins...>{})) {
                ZF_LOGE("node '%s': cannot start with an unwired input channel", name().c_str());
                return Error::UnwiredInput;
            }
            renew_outputs(std::index_sequence_for<Outs...>{});
            NodeRuntime::start(policy, [this]() { run_loop(); });
            return Empty{};
        }

        template<std::size_t I, std::size_t N = input_count>
        std::shared_ptr<Channel<std::tuple_element_t<I, std::tuple<Ins...>>>>& input() {
            static_assert(I < N, "Input index out of range");
            return std::get<I>(_inputs);
        }

        template<std::size_t I, std::size_t N = output_count>
        std::shared_ptr<Channel<std::tuple_element_t<I, std::tuple<Outs...>>>>& output() {
            static_assert(I < N, "Output index out of range");
            return std::get<I>(_outputs);
        }

        template<std::size_t N = input_count, std::enable_if_t<N == 1, int> = 0>
        auto& input_channel() { return this->template input<0, N>(); }
        template<std::size_t N = input_count, std::enable_if_t<(N >= 2), int> = 0>
        auto& input_channel1() { return this->template input<0, N>(); }
        template<std::size_t N = input_count, std::enable_if_t<(N >= 2), int> = 0>
        auto& input_channel2() { return this->template input<1, N>(); }
        template<std::size_t N = input_count, std::enable_if_t<(N >= 3), int> = 0>
        auto& input_channel3() { return this->template input<2, N>(); }

        template<std::size_t N = output_count, std::enable_if_t<N == 1, int> = 0>
        auto& output_channel() { return this->template output<0, N>(); }
        template<std::size_t N = output_count, std::enable_if_t<(N >= 2), int> = 0>
        auto& output_channel1() { return this->template output<0, N>(); }
        template<std::size_t N = output_count, std::enable_if_t<(N >= 2), int> = 0>
        auto& output_channel2() { return this->template output<1, N>(); }
        template<std::size_t N = output_count, std::enable_if_t<(N >= 3), int> = 0>
        auto& output_channel3() { return this->template output<2, N>(); }

        int output_capacity(std::size_t index) const {
            if (index >= output_count) throw std::out_of_range("Output index out of range");
            return _capacities[index];
        }

    protected:
        void on_state_changed() override {
            std::apply([](auto&... channels) {
                ((channels ? channels->notify() : void()), ...);
            }, _inputs);
        }

    private:
        struct OutputCloser {
            TypedNodeRuntime& runtime;
            ~OutputCloser() { runtime.close_outputs(); }
        };

        static std::array<int, output_count> resolve_capacities(const std::vector<int>& requested,
                                                                const RuntimeConfig& config) {
            if (requested.size() > output_count) {
                throw std::invalid_argument("More channel capacities than outputs.");
            }
            std::array<int, output_count> capacities{};
            for (std::size_t i = 0; i < output_count; ++i) {
                capacities[i] = i < requested.size() ? requested[i] : config.default_channel_capacity;
                if (capacities[i] < -1) {
                    throw std::invalid_argument("Channel capacity must be >= -1.");
                }
            }
            return capacities;
        }

        template<std::size_t... Is>
        void renew_outputs(std::index_sequence<Is...>) {
            ((std::get<Is>(_outputs) = (!std::get<Is>(_outputs) || std::get<Is>(_outputs)->is_closed())
                ? std::make_shared<Channel<std::tuple_element_t<Is, std::tuple<Outs...>>>>(_capacities[Is])
                : std::get<Is>(_outputs)), ...);
        }

        template<std::size_t... Is>
        bool inputs_wired(std::index_sequence<Is...>) const {
            return (static_cast<bool>(std::get<Is>(_inputs)) && ...);
        }

        void close_outputs() {
            std::apply([](auto&... channels) {
                ((channels ? channels->close() : void()), ...);
            }, _outputs);
        }

        void attenuate() {
            const auto delay = control_config().speed_attenuation;
            if (config().apply_speed_attenuation && delay.count() > 0) {
                this_task::sleep_for(delay);
            }
        }

        // Runs one processing call. With auto_resume_on_error a failing cycle is
        // logged and skipped, otherwise the exception ends the task in Error.
        template<typename F>
        bool invoke(F&& fn) {
            try {
                fn();
                return true;
            } catch (const std::exception& e) {
                if (!control_config().auto_resume_on_error) throw;
                ZF_LOGW("node '%s': skipping failed cycle: %s", name().c_str(), e.what());
                return false;
            }
        }

        // Join: one value from every input, in order. Values are only taken
        // while the runtime is Running, so a paused node leaves them buffered.
        // Waiting ends early once the runtime is moved to Idle or Error.
        template<std::size_t... Is>
        std::optional<std::tuple<Ins...>> receive_all(std::index_sequence<Is...>) {
            auto gate = [this]() { return is_running(); };
            auto abandon = [this]() { return is_idle() || is_error(); };
            std::tuple<std::optional<Ins>...> slots;
            bool open = true;
            ((open = open && (std::get<Is>(slots) = std::get<Is>(_inputs)->receive_when(gate, abandon)).has_value()), ...);
            if (!open) return std::nullopt;
            return std::tuple<Ins...>(std::move(*std::get<Is>(slots))...);
        }

        template<std::size_t I, typename V>
        bool send_to(const V& value) {
            if (std::get<I>(_outputs)->send(value)) return true;
            ZF_LOGI("node '%s': output %zu is closed, finishing", name().c_str(), I);
            return false;
        }

        template<typename O, std::size_t... Is>
        bool send_slots(const O& out, std::index_sequence<Is...>) {
            bool open = true;
            ((open = open && (!out.template get<Is>() || send_to<Is>(*out.template get<Is>()))), ...);
            return open;
        }

        template<typename O>
        bool send_outputs(const O& out) {
            if constexpr (output_count == 1) {
                return !out || send_to<0>(*out);
            } else {
                return send_slots(out, std::index_sequence_for<Outs...>{});
            }
        }

        void run_loop() {
            OutputCloser closer{*this};

            if constexpr (input_count == 0) {
                Emitter emitter(*this);
                while (wait_while_paused()) {
                    invoke([&]() { _process(emitter); });
                    if (emitter.closed()) break;
                    attenuate();
                    this_task::yield();
                }
            } else {
                while (wait_while_paused()) {
                    auto inputs = receive_all(std::index_sequence_for<Ins...>{});
                    if (!inputs) {
                        if (is_idle() || is_error()) {
                            ZF_LOGD("node '%s': moved to %s while waiting for input, finishing",
                                name().c_str(), to_str(execution_state()));
                        } else {
                            ZF_LOGD("node '%s': input closed, finishing", name().c_str());
                        }
                        break;
                    }
                    if constexpr (output_count == 0) {
                        invoke([&]() { std::apply(_process, *inputs); });
                    } else {
                        std::optional<output_type> out;
                        invoke([&]() { out = std::apply(_process, *inputs); });
                        if (out && !send_outputs(*out)) break;
                    }
                    attenuate();
                }
            }
        }

        process_function _process;
        std::array<int, output_count> _capacities;
        std::tuple<std::shared_ptr<Channel<Ins>>...> _inputs;
        std::tuple<std::shared_ptr<Channel<Outs>>...> _outputs;
    };

    template<typename Out>
    using GeneratorRuntime = TypedNodeRuntime<Inputs<>, Outputs<Out>>;

    template<typename In>
    using SinkRuntime = TypedNodeRuntime<Inputs<In>, Outputs<>>;

    template<typename In, typename Out>
    using TransformerRuntime = TypedNodeRuntime<Inputs<In>, Outputs<Out>>;

} // namespace conduit
