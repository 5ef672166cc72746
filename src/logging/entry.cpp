#include "entry.h"

#include <mutex>
#include <thread>
#include <unordered_map>

using std::lock_guard;
using std::string;
using std::unordered_map;

namespace logging {

// Returns a small number identifying the current thread, counting up from 1
int getThreadCounter() {
    using thread_id = std::thread::id;

    static std::mutex counterMutex;
    lock_guard<std::mutex> lock(counterMutex);

    static unordered_map<thread_id, int> threadCounters;
    static int lastThreadId = 0;
    thread_id threadId = std::this_thread::get_id();
    if (threadCounters.find(threadId) == threadCounters.end()) {
        threadCounters.insert({threadId, ++lastThreadId});
    }
    return threadCounters.find(threadId)->second;
}

Entry::Entry(Level level, const string& message) :
    timestamp(time(nullptr)),
    threadCounter(getThreadCounter()),
    level(level),
    message(message) {}

} // namespace logging
