#include <braid/nrepl_server/session.hpp>
#include <braid/runtime/error.hpp>

namespace braid::nrepl_server
{
  void stdin_buffer::append(std::string const &chunk)
  {
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      buffer_ += chunk;
    }
    ready_.notify_all();
  }

  std::string stdin_buffer::read_line(runtime::cancellation const &cancel,
                                      std::function<void()> const &on_empty)
  {
    std::unique_lock<std::mutex> lock{ mutex_ };
    auto const has_line([this] { return buffer_.find('\n') != std::string::npos; });
    while(!has_line())
    {
      if(buffer_.empty() && on_empty)
      {
        lock.unlock();
        on_empty();
        lock.lock();
      }
      ready_.wait(lock, cancel.token(), has_line);
      cancel.throw_if_cancelled();
    }

    auto const newline(buffer_.find('\n'));
    auto line(buffer_.substr(0, newline));
    buffer_.erase(0, newline + 1);
    if(!line.empty() && line.back() == '\r')
    {
      line.pop_back();
    }
    return line;
  }

  std::string stdin_buffer::unread() const
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    return buffer_;
  }

  session::session(std::string id, runtime::bindings initial, worker_pool &pool)
    : id{ std::move(id) }
    , bindings_{ std::make_shared<runtime::bindings const>(std::move(initial)) }
    , queue_{ std::make_shared<task_queue>(pool, this->id) }
  {
  }

  runtime::bindings session::snapshot() const
  {
    return *bindings_.load();
  }

  void session::set_snapshot(runtime::bindings next)
  {
    bindings_.store(std::make_shared<runtime::bindings const>(std::move(next)));
  }

  task_queue &session::queue()
  {
    return *queue_;
  }

  interrupt_slot &session::slot()
  {
    return slot_;
  }

  stdin_buffer &session::input()
  {
    return input_;
  }

  interrupt_result session::close()
  {
    return slot_.interrupt(std::nullopt);
  }
}
