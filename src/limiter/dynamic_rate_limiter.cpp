#include "limiter/dynamic_rate_limiter.hpp"
#include "globals/globals.hpp"
#include <algorithm>
#include <bit>
#include <limits>
#include <stdexcept>
#include <thread>

Dynamic_rate_limiter::Dynamic_rate_limiter()
: last_steps_(0)
{}

Dynamic_rate_limiter::Dynamic_rate_limiter(std::optional<std::uint32_t> limit)
: last_steps_(0)
{
    if(limit)
        bucket_.emplace(*limit, *limit, Token_bucket::Fill::full);
}

bool Dynamic_rate_limiter::set_limit(std::optional<std::uint32_t> limit)
{
    if(limit == this->limit())
        return false;
    if(limit)
        bucket_.emplace(*limit, *limit, Token_bucket::Fill::empty);
    else
        bucket_.reset();
    if(__PVALVE_GLOBALS__::LOG_ON)
    {
        if(limit)
            __PVALVE_GLOBALS__::DEBUG_LOGGER << "Rate limiter rebuilt: " << *limit << " units/sec" << std::endl;
        else
            __PVALVE_GLOBALS__::DEBUG_LOGGER << "Rate limiter disabled" << std::endl;
    }
    return true;
}

std::optional<std::uint32_t> Dynamic_rate_limiter::limit() const
{
    if(bucket_)
        return bucket_->rate();
    return std::nullopt;
}

std::size_t Dynamic_rate_limiter::search_step_bound(std::size_t n)
{
    // каждый шаг строго уменьшает запрос: не больше log2(n) делений пополам плюс
    // один переход к емкости, один к доступному количеству и один завершающий
    return static_cast<std::size_t>(std::bit_width(n)) + 3;
}

std::size_t Dynamic_rate_limiter::request(std::size_t n)
{
    last_steps_ = 0;
    if(n == 0)
        return 0;
    if(!bucket_)
        return n;

    const auto bound = search_step_bound(n);
    std::uint32_t want = static_cast<std::uint32_t>(std::min<std::size_t>(n, std::numeric_limits<std::uint32_t>::max()));
    for(;;)
    {
        if(++last_steps_ > bound)
            throw std::logic_error("rate limiter token search did not converge");
        if(want == 1)
            return wait_for_one();

        auto decision = bucket_->check_n(want);
        switch(decision.status)
        {
            case Acquire_status::granted:
                return want;
            case Acquire_status::exceeds_burst: // пополам, но не больше емкости
                want = std::min(want / 2, decision.available);
                break;
            case Acquire_status::not_yet: // берем то, что есть сейчас, или ждем один токен
                want = std::max<std::uint32_t>(1, std::min(decision.available, want - 1));
                break;
        }
    }
}

void Dynamic_rate_limiter::refund(std::size_t n)
{
    if(!bucket_ || n == 0)
        return;
    bucket_->put_back(static_cast<std::uint32_t>(std::min<std::size_t>(n, bucket_->burst())));
}

std::uint32_t Dynamic_rate_limiter::wait_for_one()
{
    while(bucket_->check_n(1).status != Acquire_status::granted)
        std::this_thread::sleep_for(bucket_->time_until(1));
    return 1;
}
