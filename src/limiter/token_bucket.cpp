#include "limiter/token_bucket.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

Token_bucket::Token_bucket(std::uint32_t tokens_per_sec, std::uint32_t burst, Fill fill)
: rate_per_sec_(tokens_per_sec), max_tokens_(burst), tokens_(0.0), last_update_(clock::now())
{
    if(tokens_per_sec == 0 || burst == 0)
        throw std::logic_error("token bucket needs a positive rate and burst");
    if(fill == Fill::full)
        tokens_ = max_tokens_;
}

void Token_bucket::refill()
{
    auto now = clock::now();
    auto elapsed = std::chrono::duration<double>(now - last_update_).count(); // сколько секунд прошло с последнего обновления
    tokens_ = std::min<double>(max_tokens_, tokens_ + elapsed * rate_per_sec_);
    last_update_ = now;
}

Acquire_decision Token_bucket::check_n(std::uint32_t n)
{
    if(n > max_tokens_)
        return {Acquire_status::exceeds_burst, max_tokens_};
    refill();
    if(tokens_ >= n)
    {
        tokens_ -= n;
        return {Acquire_status::granted, n};
    }
    return {Acquire_status::not_yet, static_cast<std::uint32_t>(std::floor(tokens_))};
}

void Token_bucket::put_back(std::uint32_t n)
{
    refill();
    tokens_ = std::min<double>(max_tokens_, tokens_ + n);
}

Token_bucket::clock::duration Token_bucket::time_until(std::uint32_t n)
{
    refill();
    if(tokens_ >= n)
        return clock::duration::zero();
    std::chrono::duration<double> seconds((n - tokens_) / rate_per_sec_);
    // округляем вверх, чтобы после сна токен гарантированно был
    return std::chrono::ceil<std::chrono::microseconds>(seconds);
}
