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

#include "gtest_include.h"

#include <algorithm>
#include <atomic>
#include <memory>

#include <QtGlobal>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QThread>

#include "includes/shared_ptr.h"
#include "core/cancellable.h"
#include "spotify/spotifyresult.h"
#include "spotify/spotifypagefetcher.h"

using namespace Qt::Literals::StringLiterals;

namespace {

using IntPageFetcher = SpotifyPageFetcher<int>;

// Page items are the positions they stand for, so the merged result of a correct fetch is 0..total-1 after the first page.
IntPageFetcher::PageResult MakePage(const int offset, const int page_size, const int total) {

  QList<int> items;
  for (int i = offset; i < qMin(offset + page_size, total); ++i) {
    items << i;
  }

  return items;

}

QList<int> Range(const int from, const int to) {

  QList<int> values;
  for (int i = from; i < to; ++i) {
    values << i;
  }

  return values;

}

TEST(SpotifyPageFetcherTest, RemainingOffsets) {

  EXPECT_EQ(SpotifyPageFetcherBase::RemainingOffsets(130, 50), QList<int>() << 50 << 100);
  EXPECT_EQ(SpotifyPageFetcherBase::RemainingOffsets(100, 50), QList<int>() << 50);
  EXPECT_EQ(SpotifyPageFetcherBase::RemainingOffsets(101, 50), QList<int>() << 50 << 100);
  EXPECT_TRUE(SpotifyPageFetcherBase::RemainingOffsets(50, 50).isEmpty());
  EXPECT_TRUE(SpotifyPageFetcherBase::RemainingOffsets(0, 50).isEmpty());
  EXPECT_TRUE(SpotifyPageFetcherBase::RemainingOffsets(130, 0).isEmpty());

}

TEST(SpotifyPageFetcherTest, WorkerCount) {

  EXPECT_EQ(SpotifyPageFetcherBase::WorkerCount(0), 0);
  EXPECT_EQ(SpotifyPageFetcherBase::WorkerCount(2), 2);
  EXPECT_EQ(SpotifyPageFetcherBase::WorkerCount(8), 8);
  EXPECT_EQ(SpotifyPageFetcherBase::WorkerCount(47), 8);

}

TEST(SpotifyPageFetcherTest, NoRemainingPagesMakesNoCalls) {

  std::atomic<int> calls(0);
  const IntPageFetcher::Result result = IntPageFetcher::Fetch(50, 50, [&calls](const int offset) {
    ++calls;
    return MakePage(offset, 50, 50);
  }, nullptr);

  EXPECT_TRUE(result.success());
  EXPECT_EQ(calls.load(), 0);
  EXPECT_EQ(result.worker_count, 0);
  EXPECT_TRUE(result.pages.isEmpty());

}

TEST(SpotifyPageFetcherTest, TwoRemainingPages) {

  QMutex mutex;
  QList<int> requested_offsets;
  const IntPageFetcher::Result result = IntPageFetcher::Fetch(130, 50, [&mutex, &requested_offsets](const int offset) {
    {
      QMutexLocker l(&mutex);
      requested_offsets << offset;
    }
    return MakePage(offset, 50, 130);
  }, nullptr);

  ASSERT_TRUE(result.success()) << result.ToString().toStdString();
  EXPECT_EQ(result.worker_count, 2);
  ASSERT_EQ(result.pages.count(), 2);
  EXPECT_EQ(result.pages[0].offset, 50);
  EXPECT_EQ(result.pages[1].offset, 100);
  EXPECT_EQ(result.items(), Range(50, 130));
  std::sort(requested_offsets.begin(), requested_offsets.end());
  EXPECT_EQ(requested_offsets, QList<int>() << 50 << 100);

}

TEST(SpotifyPageFetcherTest, MatchesSequentialFetchUnderReordering) {

  constexpr int kTotal = 2000;
  constexpr int kPageSize = 20;

  QList<int> sequential_items;
  for (const int offset : SpotifyPageFetcherBase::RemainingOffsets(kTotal, kPageSize)) {
    sequential_items << MakePage(offset, kPageSize, kTotal).value;
  }

  std::atomic<int> running(0);
  std::atomic<int> max_running(0);
  const IntPageFetcher::Result result = IntPageFetcher::Fetch(kTotal, kPageSize, [&running, &max_running](const int offset) {
    const int now_running = ++running;
    int previous_max = max_running.load();
    while (now_running > previous_max && !max_running.compare_exchange_weak(previous_max, now_running)) {}
    // Earlier offsets finish later so completion order differs from offset order.
    QThread::usleep(static_cast<unsigned long>((kTotal - offset) % 7) * 300);
    --running;
    return MakePage(offset, kPageSize, kTotal);
  }, nullptr);

  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.worker_count, SpotifyPageFetcherBase::kMaxWorkers);
  EXPECT_LE(max_running.load(), SpotifyPageFetcherBase::kMaxWorkers);
  EXPECT_EQ(result.items(), sequential_items);

}

TEST(SpotifyPageFetcherTest, FailedPageFailsTheWholeFetch) {

  const IntPageFetcher::Result result = IntPageFetcher::Fetch(500, 50, [](const int offset) -> IntPageFetcher::PageResult {
    if (offset == 200) {
      IntPageFetcher::PageResult page_result(SpotifyResult::ErrorCode::HttpStatusError, u"Received HTTP code 500"_s);
      page_result.http_status_code = 500;
      return page_result;
    }
    return MakePage(offset, 50, 500);
  }, nullptr);

  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error_code, SpotifyResult::ErrorCode::PaginationFailure);
  EXPECT_EQ(result.cause, SpotifyResult::ErrorCode::HttpStatusError);
  EXPECT_EQ(result.offset, 200);
  EXPECT_EQ(result.http_status_code, 500);
  EXPECT_TRUE(result.error_message.contains(u"200"_s));
  EXPECT_TRUE(result.pages.isEmpty());
  EXPECT_TRUE(result.items().isEmpty());

}

TEST(SpotifyPageFetcherTest, OnlyOneErrorIsReported) {

  const IntPageFetcher::Result result = IntPageFetcher::Fetch(1000, 50, [](const int offset) -> IntPageFetcher::PageResult {
    return IntPageFetcher::PageResult(SpotifyResult::ErrorCode::NetworkError, QStringLiteral("Page %1 failed").arg(offset));
  }, nullptr);

  EXPECT_EQ(result.error_code, SpotifyResult::ErrorCode::PaginationFailure);
  EXPECT_EQ(result.cause, SpotifyResult::ErrorCode::NetworkError);
  EXPECT_TRUE(SpotifyPageFetcherBase::RemainingOffsets(1000, 50).contains(result.offset));
  EXPECT_TRUE(result.error_message.contains(QStringLiteral("Page %1 failed").arg(result.offset)));

}

TEST(SpotifyPageFetcherTest, CancelledBeforeStart) {

  SharedPtr<Cancellable> cancellable = std::make_shared<Cancellable>();
  cancellable->Cancel();

  std::atomic<int> calls(0);
  const IntPageFetcher::Result result = IntPageFetcher::Fetch(300, 50, [&calls](const int offset) {
    ++calls;
    return MakePage(offset, 50, 300);
  }, cancellable);

  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error_code, SpotifyResult::ErrorCode::PaginationFailure);
  EXPECT_EQ(result.cause, SpotifyResult::ErrorCode::Cancelled);
  EXPECT_TRUE(result.cancelled());
  EXPECT_EQ(calls.load(), 0);
  EXPECT_TRUE(result.pages.isEmpty());

}

TEST(SpotifyPageFetcherTest, CancelledDuringFetch) {

  SharedPtr<Cancellable> cancellable = std::make_shared<Cancellable>();

  // 19 remaining offsets, no more than one page per worker can be in flight when the cancel lands.
  std::atomic<int> calls(0);
  const IntPageFetcher::Result result = IntPageFetcher::Fetch(1000, 50, [&calls, &cancellable](const int offset) {
    if (++calls == 1) cancellable->Cancel();
    return MakePage(offset, 50, 1000);
  }, cancellable);

  EXPECT_LT(calls.load(), 19);
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error_code, SpotifyResult::ErrorCode::PaginationFailure);
  EXPECT_EQ(result.cause, SpotifyResult::ErrorCode::Cancelled);
  EXPECT_TRUE(result.cancelled());
  EXPECT_TRUE(SpotifyPageFetcherBase::RemainingOffsets(1000, 50).contains(result.offset));
  EXPECT_TRUE(result.pages.isEmpty());

}

TEST(SpotifyPageFetcherTest, CancelledDuringLastPage) {

  SharedPtr<Cancellable> cancellable = std::make_shared<Cancellable>();

  std::atomic<int> calls(0);
  const IntPageFetcher::Result result = IntPageFetcher::Fetch(1000, 50, [&calls, &cancellable](const int offset) {
    if (++calls == 19) cancellable->Cancel();
    return MakePage(offset, 50, 1000);
  }, cancellable);

  EXPECT_EQ(calls.load(), 19);
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error_code, SpotifyResult::ErrorCode::Cancelled);
  EXPECT_TRUE(result.cancelled());
  EXPECT_TRUE(result.pages.isEmpty());

}

}  // namespace
