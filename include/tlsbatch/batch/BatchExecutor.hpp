// Copyright (c) 2025 tlsbatch contributors

// This file is part of tlsbatch

// tlsbatch is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. tlsbatch is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with tlsbatch. If not, see
// <https://www.gnu.org/licenses/>.

#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "BS_thread_pool.hpp"
#include <tlsbatch/logger/logger.h>
#include <tlsbatch/project/ScanPosition.hpp>

namespace tlsbatch::batch {

  struct ProcessingFailure {
    std::string message;
  };

  /**
   * @brief Result of processing one scan position, either a payload or the
   * reason it failed.
   */
  template <typename T>
  struct Outcome {
    std::string scan_pos;
    std::string scan_name;
    std::variant<T, ProcessingFailure> result;

    bool succeeded() const { return std::holds_alternative<T>(result); }
    const T& value() const { return std::get<T>(result); }
    const ProcessingFailure& failure() const {
      return std::get<ProcessingFailure>(result);
    }
  };

  template <typename T>
  struct BatchReport {
    // in the order of the input positions
    std::vector<Outcome<T>> outcomes;

    size_t attempted() const { return outcomes.size(); }
    size_t succeeded() const {
      size_t n = 0;
      for (const auto& o : outcomes) n += o.succeeded() ? 1 : 0;
      return n;
    }
    size_t failed() const { return attempted() - succeeded(); }
    bool no_work() const { return succeeded() == 0; }

    std::vector<const Outcome<T>*> successes() const {
      std::vector<const Outcome<T>*> result;
      for (const auto& o : outcomes)
        if (o.succeeded()) result.push_back(&o);
      return result;
    }
    std::vector<const Outcome<T>*> failures() const {
      std::vector<const Outcome<T>*> result;
      for (const auto& o : outcomes)
        if (!o.succeeded()) result.push_back(&o);
      return result;
    }
  };

  struct BatchOptions {
    // 1 runs the positions one after another on the calling thread
    size_t jobs = 1;
    std::string progress_name = "positions";
  };

  template <typename T>
  using PositionProcessor =
      std::function<T(const project::ScanPositionFiles& files)>;

  namespace detail {
    template <typename T>
    Outcome<T> process_one(const project::ScanPositionFiles& files,
                           const PositionProcessor<T>& process) {
      auto& logger = logger::Logger::get_logger();
      Outcome<T> outcome{files.scan_pos, files.scan_name,
                         ProcessingFailure{"Unknown exception."}};
      try {
        logger.debug("start: {}", files.scan_pos);
        outcome.result = process(files);
        logger.debug("finish: {}", files.scan_pos);
      } catch (const std::exception& e) {
        outcome.result = ProcessingFailure{e.what()};
      } catch (...) {
        outcome.result = ProcessingFailure{"Unknown exception."};
      }
      if (!outcome.succeeded()) {
        logger.warning("Error processing {}: {}", files.scan_pos,
                       outcome.failure().message);
      }
      return outcome;
    }
  }  // namespace detail

  /**
   * @brief Run process once for every position and collect the outcomes.
   *
   * An exception thrown by process becomes a failure Outcome carrying the
   * exception message, the remaining positions are still processed. With
   * more than one job the positions are processed on a thread pool, but the
   * outcomes are still returned in input order.
   */
  template <typename T>
  BatchReport<T> run_batch(
      const std::vector<project::ScanPositionFiles>& positions,
      const PositionProcessor<T>& process, const BatchOptions& options = {}) {
    auto& logger = logger::Logger::get_logger();
    std::vector<std::optional<Outcome<T>>> slots(positions.size());
    std::atomic<size_t> processed_cnt{0};

    if (options.jobs <= 1 || positions.size() <= 1) {
      for (size_t i = 0; i < positions.size(); ++i) {
        slots[i] = detail::process_one<T>(positions[i], process);
        logger.trace(options.progress_name, ++processed_cnt);
      }
    } else {
      BS::thread_pool pool(options.jobs);
      for (size_t i = 0; i < positions.size(); ++i) {
        pool.detach_task([i, &positions, &process, &slots, &processed_cnt,
                          &options] {
          slots[i] = detail::process_one<T>(positions[i], process);
          logger::Logger::get_logger().trace(options.progress_name,
                                             ++processed_cnt);
        });
      }
      pool.wait();
    }

    BatchReport<T> report;
    report.outcomes.reserve(slots.size());
    for (auto& slot : slots) {
      report.outcomes.push_back(std::move(*slot));
    }
    logger.info("Processing complete: {} successful, {} failed",
                report.succeeded(), report.failed());
    return report;
  }

}  // namespace tlsbatch::batch
