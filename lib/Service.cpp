#include "Service.h"

namespace mc {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  isStopSet_ = true;
  if (thread_.joinable()) {
    thread_.join();
  }
}

Service::Roe<void> Service::prepare() {
  if (!isStopSet_ || thread_.joinable()) {
    return Error(E_RUNNING, "Service is already running");
  }
  auto prepared = onStart();
  if (!prepared) {
    return Error(E_START, "Service onStart() failed: " + prepared.error().message);
  }
  isStopSet_ = false;
  return {};
}

Service::Roe<void> Service::start() {
  auto prepared = prepare();
  if (!prepared) {
    return prepared;
  }
  thread_ = std::thread([this] { runLoop(); });
  log().info << "Started";
  return {};
}

Service::Roe<void> Service::run() {
  auto prepared = prepare();
  if (!prepared) {
    return prepared;
  }
  log().info << "Running in the calling thread";
  runLoop();
  isStopSet_ = true;
  onStop();
  log().info << "Stopped";
  return {};
}

void Service::stop() {
  if (isStopSet_ && !thread_.joinable()) {
    return;
  }

  isStopSet_ = true;
  onStopRequested();
  if (thread_.joinable()) {
    thread_.join();
  }
  onStop();
  log().info << "Stopped";
}

} // namespace mc
