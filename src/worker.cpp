#include "worker.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace codejudge {
using namespace std;

static void worker_loop(size_t worker_id, concurrent_queue<size_t> &task_queue, const function<void(size_t)> &task, exception_ptr &error, mutex &error_mutex) {
    size_t index;
    while (task_queue.try_pop(index)) {
        try {
            task(index);
        } catch (...) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when running task " << index;
            scoped_lock guard(error_mutex);
            if (!error) error = current_exception();
        }
    }
}

void run_workers(size_t count, size_t workers, const function<void(size_t)> &task) {
    if (workers <= 1 || count <= 1) {
        for (size_t i = 0; i < count; ++i) task(i);
        return;
    }

    concurrent_queue<size_t> task_queue;
    for (size_t i = 0; i < count; ++i) task_queue.push(i);

    exception_ptr error;
    mutex error_mutex;
    vector<thread> threads;
    for (size_t i = 0; i < min(workers, count); ++i)
        threads.emplace_back(worker_loop, i, ref(task_queue), cref(task), ref(error), ref(error_mutex));
    for (auto &thread : threads) thread.join();

    if (error) rethrow_exception(error);
}

}  // namespace codejudge
