/*
 * row_blocks.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_UTIL_ROW_BLOCKS_H
#define CREDO_UTIL_ROW_BLOCKS_H

#include <algorithm>
#include <cstddef>
#include <vector>
#include <boost/thread/thread.hpp>
#include <credo/util/thread_pool.h>

namespace credo { namespace util {

  /**
   * The number of image rows in a block. The partition into blocks does not
   * depend on the number of threads, so the per-block partial sums and
   * their merge order are the same however the work is scheduled.
   */
  const std::size_t ROW_BLOCK_SIZE = 32;

  /**
   * A half open range of image rows
   */
  struct RowBlock {
    std::size_t begin;
    std::size_t end;
  };

  /**
   * Split a range of rows into consecutive blocks.
   * @param begin The first row
   * @param end One past the last row
   * @param block_size The number of rows in a block
   * @returns The list of blocks
   */
  inline std::vector<RowBlock> make_row_blocks(std::size_t begin,
                                               std::size_t end,
                                               std::size_t block_size = ROW_BLOCK_SIZE) {
    CREDO_ASSERT(block_size > 0);
    std::vector<RowBlock> blocks;
    for (std::size_t j = begin; j < end; j += block_size) {
      RowBlock block;
      block.begin = j;
      block.end = std::min(end, j + block_size);
      blocks.push_back(block);
    }
    return blocks;
  }

  /**
   * Resolve the requested number of threads; zero means one per core.
   */
  inline std::size_t resolve_nthreads(std::size_t nthreads) {
    if (nthreads == 0) {
      nthreads = boost::thread::hardware_concurrency();
    }
    return std::max<std::size_t>(nthreads, 1);
  }

  /**
   * Call function(index, block) for every block, on a thread pool if more
   * than one thread is requested. Returns when all blocks are done.
   * @param blocks The row blocks
   * @param nthreads The number of threads (0 for one per core)
   * @param function The function to call
   */
  template <typename Function>
  void for_each_row_block(const std::vector<RowBlock> &blocks,
                          std::size_t nthreads,
                          Function function) {
    nthreads = std::min(resolve_nthreads(nthreads), blocks.size());
    if (nthreads <= 1) {
      for (std::size_t i = 0; i < blocks.size(); ++i) {
        function(i, blocks[i]);
      }
      return;
    }
    ThreadPool pool(nthreads);
    for (std::size_t i = 0; i < blocks.size(); ++i) {
      RowBlock block = blocks[i];
      pool.post([&function, i, block]() { function(i, block); });
    }
    pool.wait();
  }

}}  // namespace credo::util

#endif  // CREDO_UTIL_ROW_BLOCKS_H
