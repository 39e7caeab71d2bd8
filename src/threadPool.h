#ifndef THREAD_POOL_H
#define THREAD_POOL_H

#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <glog/logging.h>

class ThreadPool {
public:
    ThreadPool(size_t num_threads): stop(false), active(0)
    {
        for (size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back([this] {
                for (;;) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(this->tasks_mutex);
                        this->cond_var.wait(lock, [this] { return this->stop || !this->tasks.empty(); });
                        if (this->stop && this->tasks.empty()) {
                            return;
                        }
                        task = std::move(this->tasks.front());
                        this->tasks.pop();
                        ++this->active;
                    }
                    try {
                        task();
                    } catch (const std::exception &e) {
                        LOG(ERROR) << "Thread pool task failed: " << e.what();
                    }
                    {
                        std::unique_lock<std::mutex> lock(this->tasks_mutex);
                        --this->active;
                        if (this->tasks.empty() && this->active == 0) {
                            this->idle_var.notify_all();
                        }
                    }
                }
            });
        }
    }

    void enqueue(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(tasks_mutex);
            tasks.push(std::move(task));
        }
        cond_var.notify_one();
    }

    // blocks until every task enqueued so far has finished
    void waitIdle() {
        std::unique_lock<std::mutex> lock(tasks_mutex);
        idle_var.wait(lock, [this] { return tasks.empty() && active == 0; });
    }


    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(tasks_mutex);
            stop = true;
        }
        cond_var.notify_all();
        for (std::thread &worker : workers) {
            worker.join();
        }
    }


private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex tasks_mutex;
    std::condition_variable cond_var;
    std::condition_variable idle_var;
    bool stop;
    size_t active;
};

#endif // THREAD_POOL_H
