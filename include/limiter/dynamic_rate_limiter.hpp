#pragma once
#include "limiter/token_bucket.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

// Либо без ограничений, либо ведро на limit токенов в секунду с емкостью limit.
// Принадлежит только потоку передачи.
class Dynamic_rate_limiter
{
    public:
        Dynamic_rate_limiter(); // без ограничений

        explicit Dynamic_rate_limiter(std::optional<std::uint32_t> limit); // стартует с полным ведром

        // Пересобирает ведро, если лимит изменился. Новое ведро пустое:
        // накопленный при старом лимите баланс не переносится.
        bool set_limit(std::optional<std::uint32_t> limit);

        std::optional<std::uint32_t> limit() const;

        bool limited() const {return bucket_.has_value();};

        // Блокируется, пока не выдан хотя бы один токен. 1 <= результат <= n при n >= 1, 0 при n == 0.
        std::size_t request(std::size_t n);

        void refund(std::size_t n); // выданные, но не переданные токены

        std::size_t last_search_steps() const {return last_steps_;}; // шагов сужения в последнем request

        static std::size_t search_step_bound(std::size_t n); // верхняя граница шагов для запроса n

    private:
        std::uint32_t wait_for_one(); // ждать ровно один токен

    private:
        std::optional<Token_bucket> bucket_;

        std::size_t last_steps_;
};
