#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <stdexcept>
#include <utility>

template<typename T>
struct Queue_stats
{
    std::optional<T> sum; // пусто, если в окне нет образцов
    std::size_t len = 0; // сколько корзин в окне
};

// Сумма образцов за последние max_age. Образцы, пришедшие в пределах одной
// корзины (max_age / max_buckets), складываются в одну запись, поэтому память
// ограничена max_buckets + 1 записями при любой частоте push.
template<typename T>
class Sum_queue
{
    public:
        using clock = std::chrono::steady_clock;

        explicit Sum_queue(clock::duration max_age, std::size_t max_buckets = 1000)
        : max_age_(max_age), granularity_(max_age / (max_buckets == 0 ? 1 : max_buckets))
        {
            if(max_age <= clock::duration::zero())
                throw std::invalid_argument("window must be positive");
        }

        void push(T sample, clock::time_point now = clock::now())
        {
            evict(now);
            if(!queue_.empty() && now - queue_.back().first < granularity_)
                queue_.back().second = queue_.back().second + sample;
            else
                queue_.emplace_back(now, std::move(sample));
        }

        Queue_stats<T> stats(clock::time_point now = clock::now()) // выбрасывает устаревшие образцы
        {
            evict(now);
            Queue_stats<T> result;
            result.len = queue_.size();
            for(const auto& [time, sample] : queue_)
            {
                if(result.sum)
                    result.sum = *result.sum + sample;
                else
                    result.sum = sample;
            }
            return result;
        }

        Queue_stats<T> push_and_stats(T sample, clock::time_point now = clock::now())
        {
            push(std::move(sample), now);
            return stats(now);
        }

        clock::duration max_age() const {return max_age_;};

        std::size_t size() const {return queue_.size();};

    private:
        void evict(clock::time_point now)
        {
            while(!queue_.empty() && now - queue_.front().first >= max_age_)
                queue_.pop_front();
        }

    private:
        clock::duration max_age_; // длина окна

        clock::duration granularity_; // ширина корзины

        std::deque<std::pair<clock::time_point, T>> queue_;
};
