#pragma once
#include <chrono>
#include <cstdint>

enum class Acquire_status
{
    granted, // токены списаны
    not_yet, // сейчас токенов не хватает, позже хватит
    exceeds_burst // запрос больше емкости ведра, не пройдет никогда
};

struct Acquire_decision
{
    Acquire_status status;
    std::uint32_t available; // granted: сколько списано, not_yet: сколько есть сейчас, exceeds_burst: емкость
};

class Token_bucket
{
    public:
        using clock = std::chrono::steady_clock;

        enum class Fill{full, empty}; // начальное заполнение

        Token_bucket(std::uint32_t tokens_per_sec, std::uint32_t burst, Fill fill = Fill::full); // конструктор

        Acquire_decision check_n(std::uint32_t n); // списать n токенов целиком или ничего

        clock::duration time_until(std::uint32_t n); // сколько ждать, пока накопится n токенов

        void put_back(std::uint32_t n); // вернуть неиспользованные токены, не больше емкости

        std::uint32_t rate() const {return rate_per_sec_;};

        std::uint32_t burst() const {return max_tokens_;};

    private:
        void refill(); // обновляет счетчик токенов

    private:
        std::uint32_t rate_per_sec_; // токенов в секунду

        std::uint32_t max_tokens_; // емкость ведра

        double tokens_; // дробная часть сохраняется, иначе на низких скоростях ведро не наполнится

        clock::time_point last_update_; // когда последний раз обновляли счетчик
};
