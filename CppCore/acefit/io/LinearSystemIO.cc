// MIT License
// Copyright 2023--present acefit developers

#include "acefit/io/LinearSystemIO.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <capnp/message.h>
#include <capnp/serialize-packed.h>

#include "acefit/Log.hpp"
#include "acefit/errors.hpp"
#include "acefit/io/LinearSystem.capnp.h"
#include "acefit/types/adapters/capnp/capnp_adapter.hpp"

namespace acefit::io {

namespace {

/**
 * @brief Owns a POSIX file descriptor.
 */
class FileDescriptor {
public:
  FileDescriptor(const std::string &path, int flags, mode_t mode = 0644)
      : m_fd(::open(path.c_str(), flags, mode)) {
    if (m_fd < 0) {
      throw Error("cannot open '" + path + "': " + std::strerror(errno));
    }
  }
  ~FileDescriptor() { ::close(m_fd); }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  int get() const { return m_fd; }

private:
  int m_fd;
};

} // namespace

void write_linear_system(const std::string &path, const LinearSystem &system) {
  ::capnp::MallocMessageBuilder message;
  auto root = message.initRoot<schema::LinearSystem>();
  root.setRows(static_cast<uint64_t>(system.rows()));
  root.setCols(static_cast<uint64_t>(system.cols()));

  auto design = root.initDesignMatrix(
      static_cast<unsigned>(system.rows() * system.cols()));
  types::adapt::capnp::populateMatrixToCapnp(design, system.A);
  auto target = root.initTarget(static_cast<unsigned>(system.y.size()));
  types::adapt::capnp::populateVectorToCapnp(target, system.y);
  auto weights = root.initWeights(static_cast<unsigned>(system.w.size()));
  types::adapt::capnp::populateVectorToCapnp(weights, system.w);

  FileDescriptor fd(path, O_WRONLY | O_CREAT | O_TRUNC);
  ::capnp::writePackedMessageToFd(fd.get(), message);
  log::debug("wrote {} x {} system to {}", system.rows(), system.cols(), path);
}

LinearSystem read_linear_system(const std::string &path) {
  FileDescriptor fd(path, O_RDONLY);
  ::capnp::ReaderOptions options;
  // Design matrices of realistic training sets exceed the 64 MiB default.
  options.traversalLimitInWords = 1ull << 40;
  ::capnp::PackedFdMessageReader message(fd.get(), options);
  auto root = message.getRoot<schema::LinearSystem>();

  const size_t rows = root.getRows();
  const size_t cols = root.getCols();
  auto design = root.getDesignMatrix();
  auto target = root.getTarget();
  auto weights = root.getWeights();
  details::require_shape(design.size() == rows * cols,
                         "stored design matrix does not match {} x {}", rows,
                         cols);
  details::require_shape(target.size() == rows && weights.size() == rows,
                         "stored target or weights do not have {} rows", rows);

  LinearSystem system;
  system.A = types::adapt::capnp::convertMatrixFromCapnp(design, rows, cols);
  system.y = types::adapt::capnp::convertVectorFromCapnp(target);
  system.w = types::adapt::capnp::convertVectorFromCapnp(weights);
  return system;
}

} // namespace acefit::io
