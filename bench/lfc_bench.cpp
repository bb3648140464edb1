// bench/lfc_bench.cpp
// 单线程 push/pop 延迟与多线程生产者/消费者吞吐量。
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "Hazard/HazardPointerOrganizer.hpp"
#include "LockFreeQueue/LockFreeQueue.hpp"
#include "LockFreeRingQueue/LockFreeRingQueue.hpp"
#include "LockFreeStack/LockFreeStack.hpp"

using namespace std::chrono;

namespace {

constexpr std::size_t kSingleThreadOps = 1'000'000;
constexpr std::size_t kItemsPerProducer = 500'000;

void print_header(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n";
}

void print_ns_per_op(const char* label, steady_clock::duration elapsed, std::size_t ops) {
    double ns = static_cast<double>(duration_cast<nanoseconds>(elapsed).count()) / ops;
    std::cout << "  " << std::left << std::setw(28) << label
              << std::right << std::fixed << std::setprecision(1) << ns << " ns/op\n";
}

void print_throughput(steady_clock::duration elapsed, std::size_t items) {
    auto ms = duration_cast<milliseconds>(elapsed).count();
    double mops = ms > 0 ? static_cast<double>(items) / ms / 1000.0 : 0.0;
    std::cout << "  Items:      " << items << "\n";
    std::cout << "  Duration:   " << ms << " ms\n";
    std::cout << "  Throughput: " << std::fixed << std::setprecision(2) << mops << " M ops/sec\n";
}

//=============================================================================
// 单线程：每个元素一次 push + 一次 pop
//=============================================================================
void benchmark_single_thread(HazardPointerOrganizer& organizer) {
    print_header("Single-thread push/pop latency");

    {
        LockFreeStack<std::size_t> stack(organizer);
        auto start = steady_clock::now();
        for (std::size_t i = 0; i < kSingleThreadOps; ++i) {
            stack.push(i);
        }
        auto mid = steady_clock::now();
        std::size_t out = 0;
        while (stack.tryPop(out)) {}
        auto end = steady_clock::now();
        print_ns_per_op("LockFreeStack push", mid - start, kSingleThreadOps);
        print_ns_per_op("LockFreeStack pop", end - mid, kSingleThreadOps);
    }
    {
        LockFreeQueue<std::size_t> queue(organizer);
        auto start = steady_clock::now();
        for (std::size_t i = 0; i < kSingleThreadOps; ++i) {
            queue.enqueue(i);
        }
        auto mid = steady_clock::now();
        std::size_t out = 0;
        while (queue.tryDequeue(out)) {}
        auto end = steady_clock::now();
        print_ns_per_op("LockFreeQueue enqueue", mid - start, kSingleThreadOps);
        print_ns_per_op("LockFreeQueue dequeue", end - mid, kSingleThreadOps);
    }
    {
        LockFreeRingQueue<std::size_t> ring(kSingleThreadOps);
        auto start = steady_clock::now();
        for (std::size_t i = 0; i < kSingleThreadOps; ++i) {
            if (!ring.tryEnqueue(i)) {
                std::cerr << "[lfc_bench] WARNING: ring queue full at " << i << std::endl;
                break;
            }
        }
        auto mid = steady_clock::now();
        std::size_t out = 0;
        while (ring.tryDequeue(out)) {}
        auto end = steady_clock::now();
        print_ns_per_op("LockFreeRingQueue enqueue", mid - start, kSingleThreadOps);
        print_ns_per_op("LockFreeRingQueue dequeue", end - mid, kSingleThreadOps);
    }
}

//=============================================================================
// 多线程：P 个生产者 / C 个消费者
//=============================================================================
template <class PushFn, class PopFn>
steady_clock::duration run_mpmc(std::size_t producers, std::size_t consumers,
                                PushFn&& push, PopFn&& pop) {
    const std::size_t total = producers * kItemsPerProducer;
    std::atomic<std::size_t> consumed{0};
    std::vector<std::thread> threads;

    auto start = steady_clock::now();
    for (std::size_t p = 0; p < producers; ++p) {
        threads.emplace_back([&, p] {
            for (std::size_t i = 0; i < kItemsPerProducer; ++i) {
                push(p * kItemsPerProducer + i);
            }
        });
    }
    for (std::size_t c = 0; c < consumers; ++c) {
        threads.emplace_back([&] {
            while (consumed.load(std::memory_order_relaxed) < total) {
                if (pop()) {
                    consumed.fetch_add(1, std::memory_order_relaxed);
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    return steady_clock::now() - start;
}

void benchmark_multi_thread(HazardPointerOrganizer& organizer, std::size_t producers, std::size_t consumers) {
    print_header("MPMC throughput (" + std::to_string(producers) + " producers, " +
                 std::to_string(consumers) + " consumers)");
    const std::size_t total = producers * kItemsPerProducer;

    {
        LockFreeStack<std::size_t> stack(organizer);
        auto elapsed = run_mpmc(producers, consumers,
            [&](std::size_t v) { stack.push(v); },
            [&] { std::size_t out; return stack.tryPop(out); });
        std::cout << "LockFreeStack\n";
        print_throughput(elapsed, total);
    }
    {
        LockFreeQueue<std::size_t> queue(organizer);
        auto elapsed = run_mpmc(producers, consumers,
            [&](std::size_t v) { queue.enqueue(v); },
            [&] { std::size_t out; return queue.tryDequeue(out); });
        std::cout << "LockFreeQueue\n";
        print_throughput(elapsed, total);
    }
    {
        LockFreeRingQueue<std::size_t> ring(4096);
        auto elapsed = run_mpmc(producers, consumers,
            [&](std::size_t v) {
                while (!ring.tryEnqueue(v)) {
                    std::this_thread::yield();
                }
            },
            [&] { std::size_t out; return ring.tryDequeue(out); });
        std::cout << "LockFreeRingQueue\n";
        print_throughput(elapsed, total);
    }
}

} // namespace

int main(int argc, char** argv) {
    std::size_t threads = std::thread::hardware_concurrency() / 2;
    if (argc > 1) {
        threads = static_cast<std::size_t>(std::strtoul(argv[1], nullptr, 10));
    }
    if (threads == 0) {
        threads = 1;
    }

    HazardPointerOrganizer organizer;

    benchmark_single_thread(organizer);
    benchmark_multi_thread(organizer, 1, 1);
    benchmark_multi_thread(organizer, threads, threads);

    std::cout << "\nRetired nodes pending: " << organizer.getRetiredCount()
              << ", reclaimed on collect: " << organizer.collect() << "\n";
    return 0;
}
