/*
  ==============================================================================
    Source/Main.cpp
    Role: WheelBridge console entry point. --list, --calibrate, --run.
  ==============================================================================
*/
#include "Core/BridgeSession.h"
#include "Core/ConfigManager.h"
#include "Core/LogService.h"
#include "Devices/BackendFactory.h"
#include "Services/CalibrationStore.h"
#include "Services/RoleWizard.h"
#include <csignal>
#include <iostream>
#include <string>

namespace {
std::atomic<bool> stopRequested{false};

void onInterrupt(int) { stopRequested.store(true); }

struct AppContext {
  ConfigManager config;
  BridgeConfig settings;
  CalibrationStore store;
  std::unique_ptr<juce::FileLogger> fileLogger;

  explicit AppContext(const juce::ArgumentList &args) {
    auto logFile = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
                       .getChildFile("WheelBridge")
                       .getChildFile("WheelBridge.log");
    fileLogger = std::make_unique<juce::FileLogger>(logFile, "WheelBridge started", 512 * 1024);
    juce::Logger::setCurrentLogger(fileLogger.get());

    auto forward = [](const juce::String &msg, bool isError) {
      if (isError)
        LogService::instance().error(msg);
      else
        LogService::instance().info(msg);
    };
    config.onLog = forward;
    store.onLog = forward;

    auto path = args.getValueForOption("--config|-c");
    auto file = path.isNotEmpty() ? juce::File::getCurrentWorkingDirectory().getChildFile(path)
                                  : ConfigManager::getDefaultConfigFile();
    if (!config.loadFromFile(file))
      juce::ConsoleApplication::fail("Fix or delete " + file.getFullPathName());

    LogService::instance().setMinimumLevel(
        LogService::levelFromName(config.get<juce::String>(ConfigKeys::logLevel, "info")));
    settings = config.snapshot();
  }

  ~AppContext() { juce::Logger::setCurrentLogger(nullptr); }
};

struct Backends {
  std::unique_ptr<InputDeviceBackend> input = BackendFactory::createInputBackend();
  std::unique_ptr<VirtualGamepadBackend> pads = BackendFactory::createVirtualGamepadBackend();

  Backends() {
    if (input == nullptr || pads == nullptr)
      juce::ConsoleApplication::fail("No wheel / virtual pad backend for this platform");
  }
};

bool waitForEnter(bool allowSkip, bool &skipped) {
  std::string line;
  if (!std::getline(std::cin, line))
    return false;
  skipped = allowSkip && (line == "s" || line == "S");
  return true;
}

BridgeResult runRoleWizard(BridgeSession &session, RoleAssignment &out) {
  RoleWizard wizard(session.getSelectedDevice());
  RawSample sample;

  while (!wizard.isComplete() && !stopRequested.load()) {
    const auto step = wizard.getStep();
    std::cout << "\n" << RoleWizard::getInstructions(step)
              << (RoleWizard::canSkip(step) ? " [Enter / s]" : " [Enter]") << std::endl;

    bool skipped = false;
    if (!waitForEnter(RoleWizard::canSkip(step), skipped))
      return BridgeResult::fail(ErrorKind::IOError, "Console input closed");

    auto r = session.readSample(50, sample);
    if (r.failed())
      return r;

    if (skipped) {
      wizard.skip(sample);
      continue;
    }
    r = wizard.advance(sample);
    if (r.failed())
      std::cout << r.getErrorMessage() << std::endl;
  }

  if (!wizard.isComplete())
    return BridgeResult::fail(ErrorKind::IOError, "Role assignment interrupted");
  out = wizard.getAssignment();
  return BridgeResult::ok();
}

BridgeResult calibrateInteractively(BridgeSession &session, AppContext &ctx) {
  RoleAssignment roles;
  auto r = runRoleWizard(session, roles);
  if (r.failed())
    return r;

  session.onCalibrationPhase = [&ctx](CalibrationService::Phase phase) {
    if (phase == CalibrationService::Phase::Resting)
      std::cout << "\nHands off the wheel and pedals..." << std::endl;
    else
      std::cout << "Now turn lock to lock and press every pedal fully ("
                << ctx.settings.motionCaptureMs / 1000 << " s)" << std::endl;
  };

  const auto window = CalibrationWindow::fromConfig(ctx.settings);
  for (int attempt = 0; attempt < 3 && !stopRequested.load(); ++attempt) {
    r = session.calibrate(window, &roles);
    if (r.wasOk() || !r.is(ErrorKind::InsufficientMovement))
      break;
    std::cout << r.getErrorMessage() << ". Try again with full travel." << std::endl;
  }
  if (r.failed())
    return r;

  if (auto profile = session.getProfile())
    ctx.store.save(*profile);
  return r;
}

int exitCodeFor(const BridgeSession &session) {
  const auto err = session.getLastError();
  return (err == ErrorKind::None || err == ErrorKind::Disconnected) ? 0 : 1;
}

void listWheels(const juce::ArgumentList &args) {
  AppContext ctx(args);
  Backends backends;
  auto wheels = backends.input->enumerate();
  if (wheels.empty()) {
    std::cout << "No racing wheels found (" << backends.input->getName() << ")" << std::endl;
    return;
  }
  for (auto &w : wheels) {
    std::cout << w.identity.getModelKey() << "  " << w.name << "  " << w.identity.path
              << "  axes=" << w.axes.size() << " buttons=" << w.buttons.size()
              << (w.hasForceFeedback ? "  FFB slots=" + juce::String(w.effectSlots) : juce::String())
              << std::endl;
  }
}

void calibrateOnly(const juce::ArgumentList &args) {
  AppContext ctx(args);
  Backends backends;
  BridgeSession session(*backends.input, *backends.pads, ctx.settings);

  auto r = session.discover();
  if (r.wasOk())
    r = session.beginCalibration();
  if (r.wasOk())
    r = calibrateInteractively(session, ctx);
  session.shutdown();
  if (r.failed())
    juce::ConsoleApplication::fail(r.describe());
  std::cout << "Calibration saved to " << ctx.store.getFile().getFullPathName() << std::endl;
}

void runBridge(const juce::ArgumentList &args) {
  AppContext ctx(args);
  Backends backends;
  BridgeSession session(*backends.input, *backends.pads, ctx.settings);

  std::signal(SIGINT, onInterrupt);
  std::signal(SIGTERM, onInterrupt);

  auto r = session.discover();
  if (r.wasOk())
    r = session.beginCalibration();
  if (r.failed())
    juce::ConsoleApplication::fail(r.describe());

  CalibrationProfile stored;
  if (ctx.store.load(session.getSelectedDevice().identity, stored) &&
      session.useStoredProfile(stored).wasOk()) {
    std::cout << "Using saved calibration (run with --calibrate to redo it)" << std::endl;
  } else {
    r = calibrateInteractively(session, ctx);
    if (r.failed()) {
      session.shutdown();
      juce::ConsoleApplication::fail(r.describe());
    }
  }

  r = session.activate();
  if (r.failed()) {
    session.shutdown();
    juce::ConsoleApplication::fail(r.describe());
  }
  std::cout << "Bridge running. Press Ctrl-C to stop." << std::endl;

  const auto &status = session.getStatus();
  uint32_t lastPollerBeat = status.pollerHeartbeat.load();
  double nextWatchMs = juce::Time::getMillisecondCounterHiRes() + 2000.0;
  while (!stopRequested.load() && session.getState() != SessionState::Terminated) {
    session.dispatchSignals(100);
    session.tick();

    // Poller watchdog: an Active session must keep publishing
    const double now = juce::Time::getMillisecondCounterHiRes();
    if (now >= nextWatchMs) {
      const uint32_t beat = status.pollerHeartbeat.load();
      if (session.getState() == SessionState::Active && beat == lastPollerBeat)
        LogService::instance().warning("Input polling stalled for 2 s");
      lastPollerBeat = beat;
      nextWatchMs = now + 2000.0;
    }
  }

  session.shutdown();
  LogService::instance().info("Published " + juce::String((int)status.publishedFrames.load()) +
                              " frames, forwarded " +
                              juce::String((int)status.forwardedEffects.load()) + " effect events");
  if (exitCodeFor(session) != 0)
    juce::ConsoleApplication::fail(errorKindName(session.getLastError()), exitCodeFor(session));
}
} // namespace

int main(int argc, char *argv[]) {
  juce::ConsoleApplication app;
  app.addHelpCommand("--help|-h", "WheelBridge: racing wheel to virtual Xbox 360 controller", true);
  app.addVersionCommand("--version|-v", "WheelBridge 1.0.0");

  app.addCommand({"--list", "--list [--config=<file>]", "Lists attached racing wheels", "",
                  listWheels});
  app.addCommand({"--calibrate", "--calibrate [--config=<file>]",
                  "Assigns wheel roles, captures ranges and saves them", "", calibrateOnly});
  app.addCommand({"--run", "--run [--config=<file>]",
                  "Bridges the wheel until Ctrl-C (default)", "", runBridge});
  app.addDefaultCommand({"--run", "--run [--config=<file>]",
                         "Bridges the wheel until Ctrl-C (default)", "", runBridge});

  return app.findAndRunCommand(argc, argv);
}
