/*
 * Spotisync
 * Copyright 2026, Spotisync contributors
 *
 * Spotisync is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Spotisync is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Spotisync.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef SPOTIFYPAGEFETCHER_H
#define SPOTIFYPAGEFETCHER_H

#include <algorithm>
#include <atomic>
#include <functional>

#include <QtGlobal>
#include <QList>
#include <QString>
#include <QFuture>
#include <QThreadPool>
#include <QtConcurrentRun>

#include "includes/shared_ptr.h"
#include "includes/channel.h"
#include "core/logging.h"
#include "core/cancellable.h"
#include "spotifyresult.h"

class SpotifyPageFetcherBase {
 public:
  static constexpr int kMaxWorkers = 8;

  // Offsets of every page after the first one: page_size, 2 * page_size, ... below total.
  static QList<int> RemainingOffsets(const int total, const int page_size);
  static int WorkerCount(const int offset_count);
};

// Fetches the remaining pages of an offset-paginated collection on a bounded set of workers.
// Pages are merged in ascending offset order. The first error to arrive fails the whole fetch, nothing partial is returned.
template<typename T>
class SpotifyPageFetcher : public SpotifyPageFetcherBase {
 public:
  using PageResult = SpotifyValueResult<QList<T>>;
  using FetchFunction = std::function<PageResult(const int offset)>;

  struct Page {
    int offset;
    QList<T> items;
  };

  class Result : public SpotifyResult {
   public:
    Result(const SpotifyResult &result = SpotifyResult()) : SpotifyResult(result), worker_count(0) {}
    QList<Page> pages;
    int worker_count;
    QList<T> items() const {
      QList<T> all_items;
      for (const Page &page : pages) {
        all_items << page.items;
      }
      return all_items;
    }
  };

  static Result Fetch(const int total, const int page_size, const FetchFunction &fetch, const SharedPtr<Cancellable> cancellable) {

    const QList<int> offsets = RemainingOffsets(total, page_size);
    const int worker_count = WorkerCount(static_cast<int>(offsets.count()));

    Result result;
    if (offsets.isEmpty()) {
      return result;
    }

    qLog(Debug) << "Fetching" << offsets.count() << "pages with" << worker_count << "workers";

    struct JobResult {
      int offset;
      PageResult page_result;
    };

    Channel<int> jobs(worker_count);
    Channel<JobResult> job_results;
    std::atomic<bool> aborted(false);

    QThreadPool threadpool;
    threadpool.setMaxThreadCount(worker_count + 1);

    QList<QFuture<void>> workers;
    workers.reserve(worker_count);
    for (int i = 0; i < worker_count; ++i) {
      workers << QtConcurrent::run(&threadpool, [&jobs, &job_results, &aborted, &fetch, cancellable]() {
        int offset = 0;
        while (jobs.Pop(offset)) {
          if (aborted.load()) continue;
          if (cancellable && cancellable->is_cancelled()) {
            job_results.Push(JobResult { offset, PageResult(SpotifyResult::ErrorCode::Cancelled, QStringLiteral("Operation cancelled")) });
            continue;
          }
          job_results.Push(JobResult { offset, fetch(offset) });
        }
      });
    }

    QFuture<void> dispatcher = QtConcurrent::run(&threadpool, [&jobs, &job_results, &workers, &offsets]() {
      for (const int offset : offsets) {
        if (!jobs.Push(offset)) break;
      }
      jobs.Close();
      for (QFuture<void> &worker : workers) {
        worker.waitForFinished();
      }
      job_results.Close();
    });

    // Drain everything so no worker is left blocked, even after the first failure.
    bool failed = false;
    JobResult job_result;
    while (job_results.Pop(job_result)) {
      if (failed) continue;
      if (!job_result.page_result.success()) {
        failed = true;
        SpotifyResult error = job_result.page_result.Wrap(SpotifyResult::ErrorCode::PaginationFailure, QStringLiteral("Failed fetching page at offset %1").arg(job_result.offset));
        error.offset = job_result.offset;
        result = Result(error);
        qLog(Error) << result.error_message;
        // Stop handing out pages, jobs already taken by workers still finish.
        aborted.store(true);
        jobs.Close();
        continue;
      }
      result.pages << Page { job_result.offset, job_result.page_result.value };
    }

    dispatcher.waitForFinished();
    result.worker_count = worker_count;

    if (!failed && cancellable && cancellable->is_cancelled()) {
      result = Result(SpotifyResult(SpotifyResult::ErrorCode::Cancelled, QStringLiteral("Operation cancelled")));
      result.worker_count = worker_count;
    }

    if (!result.success()) {
      result.pages.clear();
      return result;
    }

    std::sort(result.pages.begin(), result.pages.end(), [](const Page &a, const Page &b) { return a.offset < b.offset; });

    return result;

  }
};

#endif  // SPOTIFYPAGEFETCHER_H
