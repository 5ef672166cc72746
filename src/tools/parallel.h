#pragma once

#include <fmt/format.h>
#include <gsl_util.h>

#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

// Calls processElement for every element of the collection, using at most maxThreadCount
// concurrent workers. Once an element fails, no further elements are started; after all running
// workers have finished, the first exception is rethrown.
template <typename TCollection>
void runParallel(
    std::function<void(typename TCollection::value_type)> processElement,
    const TCollection& collection,
    int maxThreadCount
) {
    if (maxThreadCount < 1) {
        throw std::invalid_argument(fmt::format("maxThreadCount cannot be {}.", maxThreadCount));
    }

    if (maxThreadCount == 1) {
        // Process synchronously
        for (auto element : collection) {
            processElement(element);
        }
        return;
    }

    std::mutex mutex;
    int currentThreadCount = 0;
    std::condition_variable elementFinished;
    std::exception_ptr firstError;
    std::vector<std::future<void>> futures;

    // Before exiting, wait for all running tasks to finish
    auto finishRunning = gsl::finally([&] {
        std::unique_lock<std::mutex> lock(mutex);
        elementFinished.wait(lock, [&] { return currentThreadCount == 0; });
    });

    for (auto it = collection.begin(); it != collection.end(); ++it) {
        // Wait for a free worker
        {
            std::unique_lock<std::mutex> lock(mutex);
            elementFinished.wait(lock, [&] {
                return currentThreadCount < maxThreadCount || firstError;
            });
            if (firstError) break;
            ++currentThreadCount;
        }

        auto element = *it;
        std::future<void> future;
        try {
            future = std::async(std::launch::async, [&, element] {
                auto done = gsl::finally([&] {
                    std::lock_guard<std::mutex> lock(mutex);
                    --currentThreadCount;
                    elementFinished.notify_all();
                });
                try {
                    processElement(element);
                } catch (const std::exception&) {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!firstError) firstError = std::current_exception();
                }
            });
        } catch (const std::system_error&) {
            std::lock_guard<std::mutex> lock(mutex);
            --currentThreadCount;
            throw;
        }
        futures.push_back(std::move(future));
    }

    for (auto& future : futures) {
        future.get();
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

inline int getProcessorCoreCount() {
    const int coreCount = static_cast<int>(std::thread::hardware_concurrency());

    // If the number of cores cannot be determined, use a reasonable default
    return coreCount != 0 ? coreCount : 4;
}
