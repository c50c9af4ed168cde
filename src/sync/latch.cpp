#include "sync/latch.hpp"

Latch_monitor::Latch_monitor(Watch_receiver<bool> receiver)
: receiver_(std::move(receiver))
{}

bool Latch_monitor::active() const
{
    return receiver_.get();
}

Latch::Latch()
: active_(false), sender_(false)
{}

void Latch::on()
{
    active_ = true;
    publish();
}

void Latch::off()
{
    active_ = false;
    publish();
}

void Latch::toggle()
{
    active_ = !active_;
    publish();
}

Latch_monitor Latch::watch() const
{
    return Latch_monitor(sender_.subscribe());
}

void Latch::publish()
{
    sender_.send(active_);
}
