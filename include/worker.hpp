#pragma once

#include <cstddef>
#include <functional>

/**
 * 测试点评测 worker
 * 一个提交的所有测试点放入同一个任务队列，每个 worker 线程不断从队列中领取测试点下标并评测，
 * 队列为空时退出。评测结果由任务自己按照下标保存，因此结果顺序与完成顺序无关。
 */
namespace codejudge {

/**
 * @brief 使用 workers 个线程执行 task(0), task(1), ..., task(count - 1)
 * 所有任务执行完后返回。
 * @param count 任务个数
 * @param workers 线程数，不超过 1 时在当前线程中依次执行
 * @param task 任务，可以被多个线程并发调用
 * @throw 任务抛出的第一个异常，会在所有 worker 退出后重新抛出
 */
void run_workers(size_t count, size_t workers, const std::function<void(size_t)> &task);

}  // namespace codejudge
