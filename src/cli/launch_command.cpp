#include <dockhand/cli/dockhand_cli.h>
#include <dockhand/cli/launch_command.h>
#include <dockhand/config/harness_config.h>
#include <dockhand/harness/service_launcher.h>

#include <spdlog/spdlog.h>

#include <sstream>

namespace dockhand::cli {

nlohmann::json toJson(const LaunchReport& report) {
    nlohmann::json j;
    j["service"] = report.serviceName;
    j["model"] = report.model;
    j["ready"] = report.ready;
    if (report.port != 0) {
        j["port"] = report.port;
    }
    if (!report.containerName.empty()) {
        j["container"] = report.containerName;
    }
    if (!report.image.empty()) {
        j["image"] = report.image;
    }
    if (report.ready) {
        j["ready_after_ms"] = report.readyAfter.count();
    }
    if (report.load) {
        const auto& s = *report.load;
        j["load"] = {{"total", s.total},
                     {"succeeded", s.succeeded},
                     {"failed", s.failed},
                     {"wall_ms", s.wallTime.count()},
                     {"latency_ms",
                      {{"min", s.minLatency.count()},
                       {"max", s.maxLatency.count()},
                       {"mean", s.meanLatency.count()}}},
                     {"generated_tokens", s.generatedTokens}};
        j["samples"] = report.samples;
    }
    if (report.error) {
        j["error"] = {{"code", errorToString(report.error->code)},
                      {"message", report.error->message}};
    }
    return j;
}

std::string renderText(const LaunchReport& report) {
    std::ostringstream out;
    out << "Service:   " << report.serviceName << " (" << report.model << ")\n";
    if (!report.containerName.empty()) {
        out << "Container: " << report.containerName << " on port " << report.port << "\n";
    }
    if (!report.image.empty()) {
        out << "Image:     " << report.image << "\n";
    }
    if (report.ready) {
        out << "Ready:     after " << report.readyAfter.count() / 1000.0 << " s\n";
    } else {
        out << "Ready:     no\n";
    }
    if (report.load) {
        const auto& s = *report.load;
        out << "Load:      " << s.succeeded << "/" << s.total << " succeeded in "
            << s.wallTime.count() << " ms (latency min " << s.minLatency.count() << " / mean "
            << s.meanLatency.count() << " / max " << s.maxLatency.count() << " ms)\n";
        if (!report.samples.empty()) {
            out << "Sample:    " << report.samples.front() << "\n";
        }
    }
    if (report.error) {
        out << "Error:     " << report.error->message << "\n";
    }
    auto text = out.str();
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

int exitCodeFor(const LaunchReport& report) {
    if (!report.ready || report.error) {
        return 1;
    }
    if (report.load && !report.load->allSucceeded()) {
        return 1;
    }
    return 0;
}

namespace {

class LaunchCommand : public ICommand {
public:
    std::string getName() const override { return "launch"; }

    std::string getDescription() const override {
        return "Start a model service container, wait until it answers, optionally load it";
    }

    void registerCommand(CLI::App& app, DockhandCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--service-name", serviceName_, "Test configuration label")->required();
        cmd->add_option("--model", model_, "Hub model id or local model directory")->required();
        cmd->add_flag("--trust-remote-code", trustRemoteCode_,
                      "Pass --trust-remote-code to the server");
        cmd->add_option("--timeout", timeoutSeconds_,
                        "Seconds to wait for the service (default: probe.timeout)")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--port", port_, "Host port (default: random in the configured range)");
        cmd->add_option("--env", extraEnv_, "Extra container variable KEY=VALUE (repeatable)");
        cmd->add_option("--concurrency", concurrency_, "Concurrent requests to send once ready")
            ->default_val(0);
        cmd->add_option("--prompt", prompt_, "Prompt for load requests")
            ->default_val("What is Deep Learning?");
        cmd->add_option("--max-new-tokens", maxNewTokens_, "Tokens per load request")
            ->default_val(20)
            ->check(CLI::PositiveNumber);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = config::loadHarnessConfig(cli_->env(), cli_->configPath());
        if (!cfg) {
            return cfg.error();
        }

        auto spec = makeSpec();
        if (!spec) {
            return spec.error();
        }

        auto context = cli_->contextFactory()(std::move(cfg).value(), cli_->env());
        if (!context) {
            return context.error();
        }

        LaunchReport report;
        report.serviceName = serviceName_;
        report.model = model_;
        auto& ctx = *context.value();
        auto flow = ctx.runSync(launchAndLoad(ctx, std::move(spec).value(), report));
        if (!flow && !report.error) {
            report.error = flow.error();
        }

        cli_->emit(cli_->jsonOutput() ? toJson(report).dump(2) : renderText(report));

        if (exitCodeFor(report) != 0) {
            return report.error ? *report.error
                                : Error{ErrorCode::ServerError, "load requests failed"};
        }
        return {};
    }

private:
    Result<ServiceSpec> makeSpec() const {
        ServiceSpec spec;
        spec.serviceName = serviceName_;
        spec.modelReference = model_;
        spec.trustRemoteCode = trustRemoteCode_;
        for (const auto& kv : extraEnv_) {
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                return Error{ErrorCode::InvalidArgument, "--env expects KEY=VALUE, got: " + kv};
            }
            spec.extraEnv[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        return spec;
    }

    boost::asio::awaitable<Result<void>> launchAndLoad(harness::HarnessContext& ctx,
                                                       ServiceSpec spec, LaunchReport& report) {
        harness::LaunchOptions options;
        if (timeoutSeconds_ > 0) {
            options.timeout = std::chrono::seconds(timeoutSeconds_);
        }
        if (port_ != 0) {
            options.port = port_;
        }

        harness::ServiceLauncher launcher(ctx);
        auto handle = co_await launcher.launch(std::move(spec), std::move(options));
        if (!handle) {
            report.error = handle.error();
            co_return handle.error();
        }

        auto& service = handle.value();
        report.ready = true;
        report.readyAfter = service.readyAfter();
        report.port = service.container().port;
        report.containerName = service.container().name;
        report.image = service.image().tag;

        if (concurrency_ > 0) {
            auto result = co_await load::runLoad(service.client(), prompt_, maxNewTokens_,
                                                 concurrency_);
            report.load = load::summarize(result);
            for (const auto& outcome : result.outcomes) {
                if (outcome.succeeded()) {
                    report.samples.push_back(outcome.response.value().generatedText);
                } else if (!report.error) {
                    report.error = outcome.response.error();
                }
            }
            spdlog::info("[LaunchCommand] {}/{} load requests succeeded", report.load->succeeded,
                         report.load->total);
        }

        service.close();
        if (report.error) {
            co_return *report.error;
        }
        co_return Result<void>{};
    }

    DockhandCLI* cli_{nullptr};
    std::string serviceName_;
    std::string model_;
    bool trustRemoteCode_{false};
    int timeoutSeconds_{0};
    std::uint16_t port_{0};
    std::vector<std::string> extraEnv_;
    std::size_t concurrency_{0};
    std::string prompt_;
    std::uint32_t maxNewTokens_{20};
};

} // namespace

std::unique_ptr<ICommand> createLaunchCommand() {
    return std::make_unique<LaunchCommand>();
}

} // namespace dockhand::cli
