/*
  ==============================================================================
    Source/Tests/RunAll.h
    Role: Run all unit/stress tests. Invoked by WheelBridgeTests (CTest).
  ==============================================================================
*/
#pragma once
#include "BridgeSessionTest.h"
#include "CalibrationStoreTest.h"
#include "CalibrationTest.h"
#include "ConfigManagerTest.h"
#include "EffectCodecTest.h"
#include "ForceFeedbackTranslatorTest.h"
#include "InputTranslatorTest.h"
#include "NormalizationTest.h"
#include "RoleWizardTest.h"
#include "SignalQueueTest.h"
#include <juce_core/juce_core.h>

struct RunAllTests {
  /** Runs one case; logs OK / FAIL and bumps failed. */
  template <typename TestFn>
  static void runCase(const juce::String &name, TestFn &&test, int &failed) {
    juce::Logger::writeToLog("  " + name);
    try {
      if (!test()) {
        juce::Logger::writeToLog("    FAIL: assertion");
        failed++;
      } else
        juce::Logger::writeToLog("    OK");
    } catch (const std::exception &e) {
      juce::Logger::writeToLog("    FAIL: " + juce::String(e.what()));
      failed++;
    } catch (...) {
      juce::Logger::writeToLog("    FAIL: unknown exception");
      failed++;
    }
  }

  /** Run all tests. Returns true if all pass. Logs to juce::Logger. */
  static bool run() {
    juce::Logger::writeToLog("Running unit tests...");
    int failed = 0;

    runCase("NormalizationTest::run", NormalizationTest::run, failed);
    runCase("NormalizationTest::runDeadzone", NormalizationTest::runDeadzone, failed);
    runCase("NormalizationTest::runMonotonic", NormalizationTest::runMonotonic, failed);
    runCase("NormalizationTest::runPedal", NormalizationTest::runPedal, failed);

    runCase("CalibrationTest::run", CalibrationTest::run, failed);
    runCase("CalibrationTest::runInsufficientMovement", CalibrationTest::runInsufficientMovement, failed);
    runCase("CalibrationTest::runDeviceCapture", CalibrationTest::runDeviceCapture, failed);
    runCase("CalibrationTest::runProfileSwap", CalibrationTest::runProfileSwap, failed);
    runCase("CalibrationTest::runPersistShape", CalibrationTest::runPersistShape, failed);

    runCase("RoleWizardTest::run", RoleWizardTest::run, failed);
    runCase("RoleWizardTest::runInvertedSteering", RoleWizardTest::runInvertedSteering, failed);
    runCase("RoleWizardTest::runPedalDirection", RoleWizardTest::runPedalDirection, failed);
    runCase("RoleWizardTest::runDistinctShifters", RoleWizardTest::runDistinctShifters, failed);

    runCase("InputTranslatorTest::run", InputTranslatorTest::run, failed);
    runCase("InputTranslatorTest::runButtons", InputTranslatorTest::runButtons, failed);
    runCase("InputTranslatorTest::runDedicatedSteering", InputTranslatorTest::runDedicatedSteering, failed);

    runCase("EffectCodecTest::runDecode", EffectCodecTest::runDecode, failed);
    runCase("EffectCodecTest::runRumble", EffectCodecTest::runRumble, failed);
    runCase("EffectCodecTest::runRoundTrip", EffectCodecTest::runRoundTrip, failed);
    runCase("EffectCodecTest::runEncodeRules", EffectCodecTest::runEncodeRules, failed);

    runCase("ForceFeedbackTranslatorTest::run", ForceFeedbackTranslatorTest::run, failed);
    runCase("ForceFeedbackTranslatorTest::runTableExhaustion", ForceFeedbackTranslatorTest::runTableExhaustion, failed);
    runCase("ForceFeedbackTranslatorTest::runDeviceExhaustion", ForceFeedbackTranslatorTest::runDeviceExhaustion, failed);
    runCase("ForceFeedbackTranslatorTest::runHostDisconnect", ForceFeedbackTranslatorTest::runHostDisconnect, failed);
    runCase("ForceFeedbackTranslatorTest::runDeferredAttach", ForceFeedbackTranslatorTest::runDeferredAttach, failed);

    runCase("SignalQueueTest::runStressTest", SignalQueueTest::runStressTest, failed);
    runCase("SignalQueueTest::runWake", SignalQueueTest::runWake, failed);
    runCase("SignalQueueTest::runLifecycleWhenFull", SignalQueueTest::runLifecycleWhenFull, failed);

    runCase("ConfigManagerTest::run", ConfigManagerTest::run, failed);
    runCase("ConfigManagerTest::runListener", ConfigManagerTest::runListener, failed);
    runCase("ConfigManagerTest::runPersistence", ConfigManagerTest::runPersistence, failed);

    runCase("CalibrationStoreTest::run", CalibrationStoreTest::run, failed);
    runCase("CalibrationStoreTest::runCorrupted", CalibrationStoreTest::runCorrupted, failed);

    runCase("BridgeSessionTest::runTransitions", BridgeSessionTest::runTransitions, failed);
    runCase("BridgeSessionTest::runSessionScenario", BridgeSessionTest::runSessionScenario, failed);
    runCase("BridgeSessionTest::runDisconnect", BridgeSessionTest::runDisconnect, failed);
    runCase("BridgeSessionTest::runReconnect", BridgeSessionTest::runReconnect, failed);
    runCase("BridgeSessionTest::runGraceExpiry", BridgeSessionTest::runGraceExpiry, failed);
    runCase("BridgeSessionTest::runHostRelease", BridgeSessionTest::runHostRelease, failed);
    runCase("BridgeSessionTest::runEffectExhaustion", BridgeSessionTest::runEffectExhaustion, failed);
    runCase("BridgeSessionTest::runDisconnectAfterEffectErrors",
            BridgeSessionTest::runDisconnectAfterEffectErrors, failed);
    runCase("BridgeSessionTest::runShutdownWhileCalibrating",
            BridgeSessionTest::runShutdownWhileCalibrating, failed);
    runCase("BridgeSessionTest::runActivateFailure", BridgeSessionTest::runActivateFailure, failed);
    runCase("BridgeSessionTest::runOpenFailures", BridgeSessionTest::runOpenFailures, failed);
    runCase("BridgeSessionTest::runTransientIO", BridgeSessionTest::runTransientIO, failed);

    if (failed == 0)
      juce::Logger::writeToLog("All tests passed.");
    else
      juce::Logger::writeToLog("FAILED: " + juce::String(failed) + " test(s).");
    return failed == 0;
  }
};
