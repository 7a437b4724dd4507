/*
 * thread_pool.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_UTIL_THREAD_POOL_H
#define CREDO_UTIL_THREAD_POOL_H

#include <cstddef>
#include <exception>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <credo/error.h>

namespace credo { namespace util {

  /**
   * A class to implement a thread pool
   */
  class ThreadPool {
  public:
    /**
     * Instantiate with the number of required threads
     * @param N The number of threads
     */
    explicit ThreadPool(std::size_t N)
        : work_(boost::asio::make_work_guard(io_context_)), started_(0), finished_(0) {
      CREDO_ASSERT(N > 0);
      for (std::size_t i = 0; i < N; ++i) {
        threads_.create_thread([this]() { io_context_.run(); });
      }
    }

    /**
     * Destroy the thread pool and join all threads
     */
    ~ThreadPool() {
      work_.reset();
      io_context_.stop();
      threads_.join_all();
    }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /**
     * Post a function to the thread pool
     * @param function The function to call
     */
    template <typename Function>
    void post(Function function) {
      {
        boost::lock_guard<boost::mutex> lock(mutex_);
        started_++;
      }
      boost::asio::post(io_context_, FunctionRunner<Function>(function, *this));
    }

    /**
     * Wait until all posted jobs have finished. The first exception thrown
     * by a job is rethrown here.
     */
    void wait() {
      boost::unique_lock<boost::mutex> lock(mutex_);
      while (finished_ < started_) {
        done_.wait(lock);
      }
      if (exception_) {
        std::exception_ptr e = exception_;
        exception_ = nullptr;
        std::rethrow_exception(e);
      }
    }

    /** The number of worker threads */
    std::size_t size() const {
      return threads_.size();
    }

  protected:
    /**
     * A helper class to call the function and record its completion
     */
    template <typename Function>
    class FunctionRunner {
    public:
      /**
       * Create the helper class instance
       * @param function The function to call
       * @param pool The pool to notify
       */
      FunctionRunner(Function function, ThreadPool &pool)
          : function_(function), pool_(&pool) {}

      /**
       * Call the function and increment the counter
       */
      void operator()() {
        std::exception_ptr e;
        try {
          function_();
        } catch (...) {
          e = std::current_exception();
        }
        pool_->finish(e);
      }

    protected:
      Function function_;
      ThreadPool *pool_;
    };

    void finish(std::exception_ptr e) {
      boost::lock_guard<boost::mutex> lock(mutex_);
      if (e && !exception_) {
        exception_ = e;
      }
      finished_++;
      done_.notify_all();
    }

    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::thread_group threads_;
    boost::mutex mutex_;
    boost::condition_variable done_;
    std::size_t started_;
    std::size_t finished_;
    std::exception_ptr exception_;
  };

}}  // namespace credo::util

#endif  // CREDO_UTIL_THREAD_POOL_H
