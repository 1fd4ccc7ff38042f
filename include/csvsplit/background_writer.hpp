#ifndef CSVSPLIT_BACKGROUND_WRITER_HPP
#define CSVSPLIT_BACKGROUND_WRITER_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>

#include "bounded_channel.hpp"
#include "writer_interface.hpp"

namespace csvsplit {

/**
 * Runs another writer on a dedicated thread.
 *
 * The caller's thread only parses input and hands records over through a
 * bounded channel; the worker encodes and writes them. An exception thrown
 * on the worker is rethrown from the next write_record() or from close().
 */
class BackgroundWriter : public WriterInterface {
public:
    static constexpr size_t kDefaultCapacity = 4096;

    /**
     * @param inner Writer driven by the worker thread
     * @param capacity Records buffered before write_record() blocks (0 = unbounded)
     */
    explicit BackgroundWriter(WriterPtr inner, size_t capacity = kDefaultCapacity);

    ~BackgroundWriter() override;

    void write_record(const Record& record) override;

    /**
     * Wait for the worker to write every queued record and close the inner writer.
     */
    void close() override;

    size_t files_written() const override;
    size_t rows_written() const override;

private:
    void run();
    void rethrow_worker_error();

    WriterPtr inner_;
    BoundedChannel<Record> channel_;
    std::thread worker_;

    mutable std::mutex error_mutex_;
    std::exception_ptr error_;
    std::atomic<bool> failed_{false};
    bool closed_ = false;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_BACKGROUND_WRITER_HPP
