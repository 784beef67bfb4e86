#include "radish/event_log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

namespace radish {

namespace {

std::string json_escape(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
        break;
    }
  }
  return out;
}

struct EventLogWorker {
  std::mutex mutex;
  std::condition_variable cv;
  std::condition_variable drained;
  std::deque<DecodeEvent> queue;
  std::thread thread;
  bool running = false;
  bool stop = false;
  bool writing = false;
  std::string path;
  bool enabled = false;

  void set_path(const std::string& next_path) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      path = next_path;
      enabled = !path.empty();
    }
    start_if_needed();
    cv.notify_all();
  }

  bool is_enabled() {
    std::lock_guard<std::mutex> lock(mutex);
    return enabled;
  }

  void start_if_needed() {
    bool should_start = false;
    {
      std::lock_guard<std::mutex> lock(mutex);
      should_start = enabled && !running;
      if (should_start) {
        running = true;
      }
    }
    if (should_start) {
      thread = std::thread([this]() { run(); });
    }
  }

  void enqueue(DecodeEvent event) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (!enabled) {
        return;
      }
      queue.push_back(std::move(event));
    }
    cv.notify_one();
  }

  void flush() {
    std::unique_lock<std::mutex> lock(mutex);
    if (!running) {
      return;
    }
    drained.wait(lock, [&] { return queue.empty() && !writing; });
  }

  void run() {
    std::ofstream out;
    std::string active_path;
    for (;;) {
      DecodeEvent event;
      {
        std::unique_lock<std::mutex> lock(mutex);
        writing = false;
        if (queue.empty()) {
          drained.notify_all();
        }
        cv.wait(lock, [&] { return stop || !queue.empty() || path != active_path; });
        if (stop && queue.empty()) {
          break;
        }
        if (path != active_path) {
          active_path = path;
          out.close();
          if (!active_path.empty()) {
            out.open(active_path, std::ios::app);
            if (!out) {
              std::cerr << "EventLog: failed to open " << active_path << "\n";
            }
          }
        }
        if (queue.empty()) {
          continue;
        }
        event = std::move(queue.front());
        queue.pop_front();
        writing = true;
      }
      if (!out) {
        continue;
      }
      auto write_string = [&](const char* key, const std::string& value) {
        out << '"' << key << "\":\"" << json_escape(value) << '"';
      };
      out << '{';
      out << "\"type\":\"decode\",";
      write_string("name", event.name);
      out << ',';
      write_string("path", event.path);
      out << ',';
      write_string("status", event.status);
      out << ",\"sweep\":" << event.sweep;
      out << ',';
      write_string("variable", event.variable);
      if (!event.message.empty()) {
        out << ',';
        write_string("message", event.message);
      }
      out << std::fixed << std::setprecision(6);
      out << ",\"start\":" << event.start;
      out << ",\"end\":" << event.end;
      out << "}\n";
      out.flush();
    }
    std::lock_guard<std::mutex> lock(mutex);
    writing = false;
    drained.notify_all();
  }

  ~EventLogWorker() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      stop = true;
    }
    cv.notify_all();
    if (thread.joinable()) {
      thread.join();
    }
  }
};

EventLogWorker& event_log_worker() {
  static EventLogWorker worker;
  static std::once_flag env_once;
  std::call_once(env_once, [] {
    const char* env = std::getenv("RADISH_EVENT_LOG");
    if (env && *env != '\0') {
      worker.set_path(env);
    }
  });
  return worker;
}

}  // namespace

void set_event_log_path(const std::string& path) { event_log_worker().set_path(path); }

bool has_event_log() { return event_log_worker().is_enabled(); }

void log_decode_event(const DecodeEvent& event) {
  auto& worker = event_log_worker();
  if (!worker.is_enabled()) {
    return;
  }
  worker.enqueue(event);
}

void flush_event_log() { event_log_worker().flush(); }

double now_seconds() {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration<double>(now.time_since_epoch()).count();
}

void log_warning(const std::string& component, const std::string& message) {
  std::cerr << component << ": " << message << "\n";
}

void log_verbose(const std::string& component, const std::string& message) {
  static const bool verbose = []() {
    const char* env = std::getenv("RADISH_VERBOSE");
    return env != nullptr && *env != '\0' && std::string(env) != "0";
  }();
  if (verbose) {
    log_warning(component, message);
  }
}

}  // namespace radish
