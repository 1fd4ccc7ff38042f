#include "csvsplit/background_writer.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace csvsplit {

BackgroundWriter::BackgroundWriter(WriterPtr inner, size_t capacity)
    : inner_(std::move(inner)), channel_(capacity) {
    if (!inner_) {
        throw std::invalid_argument("BackgroundWriter needs a writer");
    }
    worker_ = std::thread(&BackgroundWriter::run, this);
}

BackgroundWriter::~BackgroundWriter() {
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "Error: background writer failed: " << e.what() << "\n";
    }
}

void BackgroundWriter::run() {
    try {
        while (auto record = channel_.receive()) {
            inner_->write_record(*record);
        }
        inner_->close();
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error_ = std::current_exception();
        }
        failed_ = true;
        // Unblock the producer; the error is reported on its next call
        channel_.close();
    }
}

void BackgroundWriter::rethrow_worker_error() {
    // Kept after the first rethrow so close() reports it as well
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error = error_;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void BackgroundWriter::write_record(const Record& record) {
    if (closed_) {
        throw std::logic_error("write_record() called after close()");
    }
    if (failed_) {
        rethrow_worker_error();
    }
    if (!channel_.send(record)) {
        // The worker closed the channel because it failed
        rethrow_worker_error();
        throw std::logic_error("background writer stopped");
    }
}

void BackgroundWriter::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    channel_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
    rethrow_worker_error();
}

size_t BackgroundWriter::files_written() const {
    return inner_->files_written();
}

size_t BackgroundWriter::rows_written() const {
    return inner_->rows_written();
}

}  // namespace csvsplit
