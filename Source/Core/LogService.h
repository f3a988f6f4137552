/*
  ==============================================================================
    Source/Core/LogService.h
    Role: Unified logging for the bridge. Console + juce::Logger (FileLogger
    installed by Main), callable from the polling and FFB threads.
  ==============================================================================
*/
#pragma once

#include <iostream>
#include <juce_core/juce_core.h>

class LogService {
public:
  enum class Level { Debug, Info, Warning, Error };

  static LogService &instance() {
    static LogService svc;
    return svc;
  }

  void log(const juce::String &msg, Level level = Level::Info) {
    if (static_cast<int>(level) < minimumLevel.load(std::memory_order_relaxed))
      return;

    const juce::String line = levelPrefix(level) + msg;
    {
      const juce::ScopedLock sl(writeLock);
      std::cout << line << std::endl;
      // Goes to the FileLogger when one is installed, else the debugger.
      if (juce::Logger::getCurrentLogger() != nullptr)
        juce::Logger::writeToLog(line);
      else
        juce::Logger::outputDebugString(line);
    }
  }

  void debug(const juce::String &msg) { log(msg, Level::Debug); }
  void info(const juce::String &msg) { log(msg, Level::Info); }
  void warning(const juce::String &msg) { log(msg, Level::Warning); }
  void error(const juce::String &msg) { log(msg, Level::Error); }

  void setMinimumLevel(Level level) {
    minimumLevel.store(static_cast<int>(level), std::memory_order_relaxed);
  }

  /** "debug" / "info" / "warning" / "error"; anything else means Info. */
  static Level levelFromName(const juce::String &name) {
    auto n = name.trim().toLowerCase();
    if (n == "debug")
      return Level::Debug;
    if (n == "warning" || n == "warn")
      return Level::Warning;
    if (n == "error")
      return Level::Error;
    return Level::Info;
  }

private:
  LogService() = default;

  juce::String levelPrefix(Level level) const {
    switch (level) {
    case Level::Debug:
      return "[DEBUG] ";
    case Level::Info:
      return "[INFO] ";
    case Level::Warning:
      return "[WARN] ";
    case Level::Error:
      return "[ERROR] ";
    default:
      return "";
    }
  }

  juce::CriticalSection writeLock;
  std::atomic<int> minimumLevel{static_cast<int>(Level::Info)};
};

/** Convenience: write to LogService for debug/user feedback. */
inline void writeDebugLog(const juce::String &msg) {
  LogService::instance().debug(msg);
}
