#include <cstdlib>
#include <thread>

#include <sidecar/sidecar.hpp>

namespace sidecar {

LaunchOrchestrator::LaunchOrchestrator(LaunchConfiguration config,
                                       PresentationLayer& presentation,
                                       ProcessSupervisor& supervisor,
                                       HealthProbe& probe,
                                       Terminator terminator,
                                       Sleeper sleeper)
    : config(std::move(config)),
      presentation(presentation),
      supervisor(supervisor),
      probe(probe),
      terminator(std::move(terminator)),
      sleeper(std::move(sleeper)) {
    // The readiness thread may be the caller, so static destructors must not run
    // while the UI thread is still inside them.
    if (!this->terminator)
        this->terminator = [](int exitCode) {
            Logger::shutdown();
            std::quick_exit(exitCode);
        };
    if (!this->sleeper)
        this->sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

LaunchOrchestrator::~LaunchOrchestrator() {
    waitForReadiness();
    child.reset();
}

ViewOptions LaunchOrchestrator::splashOptions() const {
    ViewOptions options;
    options.id = kSplashViewId;
    options.title = config.splash.title;
    options.contentKind = ViewOptions::ContentKind::Html;
    options.content = splash::html(config.splash.title);
    options.width = config.splash.width;
    options.height = config.splash.height;
    options.resizable = false;
    options.decorations = false;
    options.centered = true;
    options.visible = true;
    options.onUserClose = [] { EventLoop::stop(); };
    return options;
}

ViewOptions LaunchOrchestrator::mainViewOptions() const {
    ViewOptions options;
    options.id = kMainViewId;
    options.title = config.mainView.title;
    options.contentKind = ViewOptions::ContentKind::Url;
    options.content = config.endpoint.baseUrl();
    options.width = config.mainView.width;
    options.height = config.mainView.height;
    options.minWidth = config.mainView.minWidth;
    options.minHeight = config.mainView.minHeight;
    options.centered = true;
    // revealed once the splash is gone
    options.visible = false;
    options.onUserClose = [] { EventLoop::stop(); };
    return options;
}

LaunchStatus LaunchOrchestrator::start() {
    if (started)
        return LaunchStatus::ALREADY_STARTED;
    started = true;

    auto logger = Logger::global();
    std::string error;

    if (config.splash.enabled) {
        splashView_ = presentation.createView(splashOptions(), error);
        if (!splashView_) {
            logger->logError("Failed to create splash window: %s", error.c_str());
            return LaunchStatus::VIEW_CREATION_FAILED;
        }
    }

    auto executable = supervisor.locate(config.sidecar.name);
    if (!executable) {
        logger->logError("Failed to create sidecar command: %s not found", config.sidecar.name.c_str());
        abortStartup();
        return LaunchStatus::SPAWN_CAPABILITY_UNAVAILABLE;
    }

    SpawnRequest request{*executable, {}, config.sidecarEnvironment()};
    child = supervisor.spawn(request, error);
    if (!child) {
        logger->logError("Failed to spawn backend sidecar: %s", error.c_str());
        abortStartup();
        return LaunchStatus::SPAWN_FAILED;
    }

    ReadinessController::StatusSink statusSink{};
    if (splashView_)
        statusSink = [this](const std::string& status) { post(StatusUpdate{status}); };
    controller = std::make_unique<ReadinessController>(probe, config.readiness, std::move(statusSink), sleeper);

    logger->logInfo("Waiting for backend at %s (up to %u x %lld ms)",
                    config.endpoint.probeUrl().c_str(),
                    config.readiness.maxRetries,
                    static_cast<long long>(config.readiness.retryDelay.count()));
    worker = std::thread([this] { runReadiness(); });
    return LaunchStatus::OK;
}

void LaunchOrchestrator::abortStartup() {
    if (splashView_) {
        presentation.closeView(splashView_);
        splashView_ = nullptr;
    }
}

void LaunchOrchestrator::runReadiness() {
    setCurrentThreadNameIfPossible("sidecar-readiness");

    auto outcome = controller->run();
    post(OutcomeReached{outcome});

    if (outcome == LaunchOutcome::BackendFailed) {
        // leave the error on screen long enough to be read
        if (config.splash.enabled)
            sleeper(config.splash.failureHold);
        terminator(1);
    }
    readinessDone = true;
}

void LaunchOrchestrator::post(LaunchMessage message) {
    EventLoop::enqueueTaskOnMainThread([this, message = std::move(message)] {
        apply(message);
    });
}

void LaunchOrchestrator::apply(const LaunchMessage& message) {
    if (auto status = std::get_if<StatusUpdate>(&message)) {
        // stale updates can still be queued behind the outcome
        if (splashView_ && !appliedOutcome_)
            presentation.updateStatusText(splashView_, status->text);
        return;
    }

    auto outcome = std::get<OutcomeReached>(message).outcome;
    appliedOutcome_ = outcome;
    if (outcome == LaunchOutcome::BackendReady)
        onBackendReady();
    else
        onBackendFailed();
}

void LaunchOrchestrator::onBackendReady() {
    std::string error;
    mainView_ = presentation.createView(mainViewOptions(), error);
    if (!mainView_) {
        Logger::global()->logError("Failed to create main window: %s", error.c_str());
        terminator(1);
        return;
    }

    if (splashView_) {
        presentation.closeView(splashView_);
        splashView_ = nullptr;
    }
    mainView_->show();
}

void LaunchOrchestrator::onBackendFailed() {
    if (splashView_)
        presentation.showStatusError(splashView_, config.splash.failureMessage, config.splash.failureColor);
}

void LaunchOrchestrator::waitForReadiness() {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
        worker.join();
}

bool LaunchOrchestrator::readinessPending() const {
    return worker.joinable() && !readinessDone;
}

void LaunchOrchestrator::stopBackend() {
    if (child)
        child->terminate();
}

}
