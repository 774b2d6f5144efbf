/**
 * @file log_capture.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/capture/log_capture.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace omk {

CaptureHandle::CaptureHandle(std::unique_ptr<std::ofstream> file, std::unique_ptr<IBackgroundProcess> process,
                             std::string outputPath)
    : file_(std::move(file)), process_(std::move(process)), outputPath_(std::move(outputPath)) {}

CaptureHandle::~CaptureHandle() { (void)stop(); }

CaptureHandle::CaptureHandle(CaptureHandle&& other) noexcept
    : file_(std::move(other.file_)), process_(std::move(other.process_)), outputPath_(std::move(other.outputPath_)) {}

CaptureHandle& CaptureHandle::operator=(CaptureHandle&& other) noexcept {
    if (this != &other) {
        (void)stop();
        file_ = std::move(other.file_);
        process_ = std::move(other.process_);
        outputPath_ = std::move(other.outputPath_);
    }
    return *this;
}

bool CaptureHandle::stop() noexcept {
    bool clean = true;
    try {
        if (process_) {
            std::string error;
            if (!process_->requestStop(error)) {
                std::cerr << "[omk-capture] stop request failed for " << outputPath_ << ": " << error << '\n';
                clean = false;
            }
            (void)process_->wait();
            if (process_->forceKilled()) {
                std::cerr << "[omk-capture] log stream for " << outputPath_
                          << " ignored termination and was killed\n";
                clean = false;
            }
            process_.reset();
        }
        if (file_) {
            file_->flush();
            file_->close();
            if (file_->fail()) {
                std::cerr << "[omk-capture] closing " << outputPath_ << " reported an error\n";
                clean = false;
            }
            file_.reset();
        }
    } catch (const std::exception& ex) {
        std::cerr << "[omk-capture] teardown of " << outputPath_ << " failed: " << ex.what() << '\n';
        process_.reset();
        file_.reset();
        clean = false;
    }
    return clean;
}

bool CaptureHandle::active() const noexcept { return static_cast<bool>(process_); }

const std::string& CaptureHandle::outputPath() const noexcept { return outputPath_; }

LogCapture::LogCapture(DeviceClient& device) : device_(device) {}

CaptureHandle LogCapture::start(const std::string& outputPath, const std::vector<std::string>& filterSpec) {
    device_.clearLog();

    auto file = std::make_unique<std::ofstream>(outputPath, std::ios::out | std::ios::trunc);
    if (!*file) {
        throw std::runtime_error("cannot open device log file: " + outputPath);
    }

    auto process = device_.spawnLogStream(filterSpec, *file);
    return CaptureHandle(std::move(file), std::move(process), outputPath);
}

} // namespace omk
