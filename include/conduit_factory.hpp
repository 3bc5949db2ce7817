#pragma once

#include "conduit_config.hpp"
#include "conduit_model.hpp"
#include "conduit_typed_runtime.hpp"
#include <memory>
#include <string>
#include <typeinfo>
#include <vector>

namespace conduit {

    class RuntimeRegistry;

    struct RuntimeOptions {
        std::string id;                        // generated from the name when empty
        std::string description;
        std::vector<int> output_capacities;    // per output; missing entries use config.default_channel_capacity
        ControlConfig control_config;
        RuntimeRegistry* registry = nullptr;
        RuntimeConfig config;
    };

    namespace detail {

        std::string generate_node_id(const std::string& name);
        std::string demangle(const char* mangled);

        template<typename T>
        std::string type_name() {
            return demangle(typeid(T).name());
        }

        template<typename InputList, typename OutputList>
        struct node_builder;

        template<typename... Ins, typename... Outs>
        struct node_builder<Inputs<Ins...>, Outputs<Outs...>> {
            static const char* default_node_type() {
                if (sizeof...(Ins) == 0) return "Generator";
                if (sizeof...(Outs) == 0) return "Sink";
                if (sizeof...(Ins) == 1 && sizeof...(Outs) == 1) return "Transformer";
                return "Processor";
            }

            // Ports are named "input"/"output" for a single port, "input1".. otherwise
            static CodeNode build(const std::string& name, const RuntimeOptions& options,
                                  const char* node_type) {
                CodeNode node;
                node.id = options.id.empty() ? generate_node_id(name) : options.id;
                node.name = name;
                node.node_type = node_type ? node_type : default_node_type();
                node.description = options.description;
                node.control_config = options.control_config;

                const std::vector<std::string> in_types{type_name<Ins>()...};
                for (std::size_t i = 0; i < in_types.size(); ++i) {
                    const std::string port_name = in_types.size() == 1 ? "input" : "input" + std::to_string(i + 1);
                    node.input_ports.push_back(
                        Port::input(node.id + "_" + port_name, port_name, in_types[i], node.id, true));
                }
                const std::vector<std::string> out_types{type_name<Outs>()...};
                for (std::size_t i = 0; i < out_types.size(); ++i) {
                    const std::string port_name = out_types.size() == 1 ? "output" : "output" + std::to_string(i + 1);
                    node.output_ports.push_back(
                        Port::output(node.id + "_" + port_name, port_name, out_types[i], node.id));
                }
                return node;
            }
        };

    } // namespace detail

    template<typename InputList, typename OutputList>
    using RuntimePtr = std::unique_ptr<TypedNodeRuntime<InputList, OutputList>>;

    template<typename InputList, typename OutputList>
    RuntimePtr<InputList, OutputList> create_runtime(
            const std::string& name,
            typename TypedNodeRuntime<InputList, OutputList>::process_function process,
            const RuntimeOptions& options = RuntimeOptions{},
            const char* node_type = nullptr) {
        CodeNode node = detail::node_builder<InputList, OutputList>::build(name, options, node_type);
        return std::make_unique<TypedNodeRuntime<InputList, OutputList>>(
            std::move(node), std::move(process), options.output_capacities,
            options.registry, options.config);
    }

    // ---- 0 inputs

    template<typename A>
    RuntimePtr<Inputs<>, Outputs<A>> create_in0_out1(const std::string& name,
            typename TypedNodeRuntime<Inputs<>, Outputs<A>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<>, Outputs<A>>(name, std::move(f), options);
    }

    template<typename A, typename B>
    RuntimePtr<Inputs<>, Outputs<A, B>> create_in0_out2(const std::string& name,
            typename TypedNodeRuntime<Inputs<>, Outputs<A, B>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<>, Outputs<A, B>>(name, std::move(f), options);
    }

    template<typename A, typename B, typename C>
    RuntimePtr<Inputs<>, Outputs<A, B, C>> create_in0_out3(const std::string& name,
            typename TypedNodeRuntime<Inputs<>, Outputs<A, B, C>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<>, Outputs<A, B, C>>(name, std::move(f), options);
    }

    // ---- 1 input

    template<typename In>
    RuntimePtr<Inputs<In>, Outputs<>> create_in1_out0(const std::string& name,
            typename TypedNodeRuntime<Inputs<In>, Outputs<>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In>, Outputs<>>(name, std::move(f), options);
    }

    template<typename In, typename A>
    RuntimePtr<Inputs<In>, Outputs<A>> create_in1_out1(const std::string& name,
            typename TypedNodeRuntime<Inputs<In>, Outputs<A>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In>, Outputs<A>>(name, std::move(f), options);
    }

    template<typename In, typename A, typename B>
    RuntimePtr<Inputs<In>, Outputs<A, B>> create_in1_out2(const std::string& name,
            typename TypedNodeRuntime<Inputs<In>, Outputs<A, B>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In>, Outputs<A, B>>(name, std::move(f), options);
    }

    template<typename In, typename A, typename B, typename C>
    RuntimePtr<Inputs<In>, Outputs<A, B, C>> create_in1_out3(const std::string& name,
            typename TypedNodeRuntime<Inputs<In>, Outputs<A, B, C>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In>, Outputs<A, B, C>>(name, std::move(f), options);
    }

    // ---- 2 inputs

    template<typename In1, typename In2>
    RuntimePtr<Inputs<In1, In2>, Outputs<>> create_in2_out0(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2>, Outputs<>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2>, Outputs<>>(name, std::move(f), options);
    }

    template<typename In1, typename In2, typename A>
    RuntimePtr<Inputs<In1, In2>, Outputs<A>> create_in2_out1(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2>, Outputs<A>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2>, Outputs<A>>(name, std::move(f), options);
    }

    template<typename In1, typename In2, typename A, typename B>
    RuntimePtr<Inputs<In1, In2>, Outputs<A, B>> create_in2_out2(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2>, Outputs<A, B>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2>, Outputs<A, B>>(name, std::move(f), options);
    }

    template<typename In1, typename In2, typename A, typename B, typename C>
    RuntimePtr<Inputs<In1, In2>, Outputs<A, B, C>> create_in2_out3(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2>, Outputs<A, B, C>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2>, Outputs<A, B, C>>(name, std::move(f), options);
    }

    // ---- 3 inputs

    template<typename In1, typename In2, typename In3>
    RuntimePtr<Inputs<In1, In2, In3>, Outputs<>> create_in3_out0(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2, In3>, Outputs<>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2, In3>, Outputs<>>(name, std::move(f), options);
    }

    template<typename In1, typename In2, typename In3, typename A>
    RuntimePtr<Inputs<In1, In2, In3>, Outputs<A>> create_in3_out1(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2, In3>, Outputs<A>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2, In3>, Outputs<A>>(name, std::move(f), options);
    }

    template<typename In1, typename In2, typename In3, typename A, typename B>
    RuntimePtr<Inputs<In1, In2, In3>, Outputs<A, B>> create_in3_out2(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2, In3>, Outputs<A, B>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2, In3>, Outputs<A, B>>(name, std::move(f), options);
    }

    template<typename In1, typename In2, typename In3, typename A, typename B, typename C>
    RuntimePtr<Inputs<In1, In2, In3>, Outputs<A, B, C>> create_in3_out3(const std::string& name,
            typename TypedNodeRuntime<Inputs<In1, In2, In3>, Outputs<A, B, C>>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_runtime<Inputs<In1, In2, In3>, Outputs<A, B, C>>(name, std::move(f), options);
    }

    // ---- common shapes

    template<typename Out>
    RuntimePtr<Inputs<>, Outputs<Out>> create_generator(const std::string& name,
            typename GeneratorRuntime<Out>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_in0_out1<Out>(name, std::move(f), options);
    }

    template<typename In>
    RuntimePtr<Inputs<In>, Outputs<>> create_sink(const std::string& name,
            typename SinkRuntime<In>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_in1_out0<In>(name, std::move(f), options);
    }

    template<typename In, typename Out>
    RuntimePtr<Inputs<In>, Outputs<Out>> create_transformer(const std::string& name,
            typename TransformerRuntime<In, Out>::process_function f,
            const RuntimeOptions& options = RuntimeOptions{}) {
        return create_in1_out1<In, Out>(name, std::move(f), options);
    }

    // Forwards values for which predicate is true and drops the rest
    template<typename T>
    RuntimePtr<Inputs<T>, Outputs<T>> create_filter(const std::string& name,
            std::function<bool(const T&)> predicate,
            const RuntimeOptions& options = RuntimeOptions{}) {
        if (!predicate) throw std::invalid_argument("Filter predicate is empty.");
        return create_runtime<Inputs<T>, Outputs<T>>(name,
            [predicate = std::move(predicate)](const T& value) -> std::optional<T> {
                if (predicate(value)) return value;
                return std::nullopt;
            },
            options, "Filter");
    }

} // namespace conduit
