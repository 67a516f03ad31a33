#include "duplexio/io_context.hpp"

#include <cerrno>

#include "duplexio/detail/io_utils.hpp"
#include "duplexio/logging.hpp"

namespace duplexio {

io_context::io_context(unsigned entries, uint32_t flags) {
  io_uring_params p{};
  p.flags = flags;
  io_uring_queue_init_params(entries, &ring_, &p) | detail::panic_on_err("io_uring_queue_init_params", false);
  LOG_DEBUG("io_context up, ring fd: {}, entries: {}", ring_.ring_fd, entries);
}

io_context::~io_context() noexcept { io_uring_queue_exit(&ring_); }

io_awaitable io_context::read(int fd, void *buf, unsigned nbytes, uint64_t offset, uint8_t iflags) {
  return make_awaitable(IORING_OP_READ, fd, buf, nbytes, offset, 0, iflags);
}

io_awaitable io_context::write(int fd, const void *buf, unsigned nbytes, uint64_t offset, uint8_t iflags) {
  return make_awaitable(IORING_OP_WRITE, fd, buf, nbytes, offset, 0, iflags);
}

io_awaitable io_context::fsync(int fd, unsigned fsync_flags, uint8_t iflags) {
  return make_awaitable(IORING_OP_FSYNC, fd, nullptr, 0, 0, fsync_flags, iflags);
}

io_awaitable io_context::shutdown(int fd, int how, uint8_t iflags) {
  return make_awaitable(IORING_OP_SHUTDOWN, fd, nullptr, static_cast<unsigned>(how), 0, 0, iflags);
}

io_awaitable io_context::close(int fd, uint8_t iflags) {
  return make_awaitable(IORING_OP_CLOSE, fd, nullptr, 0, 0, 0, iflags);
}

io_awaitable io_context::nop(uint8_t iflags) { return make_awaitable(IORING_OP_NOP, -1, nullptr, 0, 0, 0, iflags); }

void io_context::prepare(const detail::io_request &req, detail::io_token *token) {
  auto *sqe = get_sqe_safe();
  io_uring_prep_rw(req.opcode, sqe, req.fd, req.addr, req.len, req.offset);
  sqe->rw_flags = static_cast<int>(req.op_flags);
  io_uring_sqe_set_flags(sqe, req.iflags);
  io_uring_sqe_set_data(sqe, token);
}

void io_awaitable::awaiter::await_suspend(std::coroutine_handle<> continuation) {
  token.continuation = continuation;
  ctx->prepare(req, &token);
}

void io_context::wait_for_completions(unsigned min_c) {
  int ret;
  do {
    ret = io_uring_submit_and_wait(&ring_, min_c);
  } while (ret == -EINTR);
  ret | detail::panic_on_err("io_uring_submit_and_wait", false);
}

void io_context::handle_completions() {
  io_uring_cqe *cqe;
  unsigned head;
  io_uring_for_each_cqe(&ring_, head, cqe) {
    ++cqe_count_;
    auto *token = static_cast<detail::io_token *>(io_uring_cqe_get_data(cqe));
    LOG_TRACE("request completes with: {}", cqe->res);
    token->resolve(cqe->res);
  }
  io_uring_cq_advance(&ring_, cqe_count_);
  cqe_count_ = 0;
}

io_uring_sqe *io_context::get_sqe_safe() {
  auto *sqe = io_uring_get_sqe(&ring_);
  if (__builtin_expect(!!sqe, true)) {
    return sqe;
  }
  // If no sqe available, just submit what we have to the kernel.
  LOG_DEBUG("submission queue full, submit before getting a sqe");
  io_uring_submit(&ring_) | detail::panic_on_err("io_uring_submit", false);
  sqe = io_uring_get_sqe(&ring_);
  if (sqe == nullptr) {
    detail::panic("io_uring_get_sqe", EBUSY);
  }
  return sqe;
}

}  // namespace duplexio
