#include <comms.h>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <fmt/core.h>

using namespace std;

static const char* kJobsEndpoint = "inproc://grnfit-jobs";
static const char* kResultsEndpoint = "inproc://grnfit-results";

void MessageWrapper::addField(const std::string& name, int val)
{
  append(name);
  append(dtype::Int);
  append(val);
}

void MessageWrapper::addField(const std::string& name, const std::string& str)
{
  append(name);
  append(dtype::String);
  append(str);
}

void MessageWrapper::addField(const std::string& name, const Eigen::ArrayXd& arr)
{
  append(name);
  append(dtype::ArrayXd);
  append((int)arr.size());
  uint8_t const *dptr = reinterpret_cast<uint8_t const *>(arr.data());
  for (int i = 0; i < arr.size() * 8; ++i)
    data_.push_back(dptr[i]);
}

void MessageWrapper::addField(const std::string& name, const Eigen::ArrayXXd& arr)
{
  append(name);
  append(dtype::ArrayXXd);
  append((int)arr.rows());
  append((int)arr.cols());
  uint8_t const *dptr = reinterpret_cast<uint8_t const *>(arr.data());
  for (int i = 0; i < arr.size() * 8; ++i)
    data_.push_back(dptr[i]);
}

void MessageWrapper::addField(const std::string& name, const std::vector<std::string>& strings)
{
  append(name);
  append(dtype::Strings);
  append(strings);
}

void MessageWrapper::append(int val)
{
  uint8_t* ptr = reinterpret_cast<uint8_t*>(&val);
  for (int i = 0; i < 4; ++i)
    data_.push_back(ptr[i]);
}

void MessageWrapper::append(const std::string& str)
{
  append((int)str.size());
  uint8_t const* ptr = reinterpret_cast<uint8_t const*>(str.data());
  for (size_t i = 0; i < str.size(); ++i)
    data_.push_back(ptr[i]);
}

void MessageWrapper::append(const std::vector<std::string>& strings)
{
  append((int)strings.size());
  for (const string& str : strings)
    append(str);
}

MessageReader::MessageReader(const std::vector<uint8_t>& data) :
  data_(data)
{
  parse();
}

MessageReader::MessageReader(const zmq::message_t& msg) :
  data_(msg.data<uint8_t>(), msg.data<uint8_t>() + msg.size())
{
  parse();
}

void MessageReader::require(size_t pos, size_t num_bytes) const
{
  if (pos + num_bytes > data_.size())
    throw std::runtime_error(fmt::format("Truncated message: need {} bytes at offset {}, have {}.",
                                         num_bytes, pos, data_.size()));
}

int MessageReader::readInt(size_t* pos) const
{
  require(*pos, 4);
  int val;
  memcpy(&val, data_.data() + *pos, 4);
  *pos += 4;
  return val;
}

std::string MessageReader::readString(size_t* pos) const
{
  int len = readInt(pos);
  if (len < 0)
    throw std::runtime_error(fmt::format("Negative string length {} in message.", len));
  require(*pos, len);
  string str(reinterpret_cast<const char*>(data_.data()) + *pos, len);
  *pos += len;
  return str;
}

void MessageReader::parse()
{
  if (data_.empty() || data_[0] != MessageWrapper::kMagic)
    throw std::runtime_error("Message does not start with the magic number.");

  size_t pos = 1;
  while (pos < data_.size()) {
    string name = readString(&pos);
    require(pos, 1);
    MessageWrapper::dtype type = static_cast<MessageWrapper::dtype>(data_[pos]);
    pos += 1;
    fields_[name] = std::make_pair(type, pos);

    // Skip over the payload.
    switch (type) {
    case MessageWrapper::Int:
      require(pos, 4);
      pos += 4;
      break;
    case MessageWrapper::String:
      readString(&pos);
      break;
    case MessageWrapper::Strings: {
      int num = readInt(&pos);
      for (int i = 0; i < num; ++i)
        readString(&pos);
      break;
    }
    case MessageWrapper::ArrayXd: {
      int num = readInt(&pos);
      require(pos, size_t(num) * 8);
      pos += size_t(num) * 8;
      break;
    }
    case MessageWrapper::ArrayXXd: {
      int rows = readInt(&pos);
      int cols = readInt(&pos);
      require(pos, size_t(rows) * cols * 8);
      pos += size_t(rows) * cols * 8;
      break;
    }
    default:
      throw std::runtime_error(fmt::format("Unknown field type {} for field \"{}\".", int(type), name));
    }
  }
}

size_t MessageReader::field(const std::string& name, MessageWrapper::dtype type) const
{
  auto it = fields_.find(name);
  if (it == fields_.end())
    throw std::runtime_error(fmt::format("Message has no field \"{}\".", name));
  if (it->second.first != type)
    throw std::runtime_error(fmt::format("Field \"{}\" has type {}, expected {}.", name, int(it->second.first), int(type)));
  return it->second.second;
}

int MessageReader::intField(const std::string& name) const
{
  size_t pos = field(name, MessageWrapper::Int);
  return readInt(&pos);
}

std::string MessageReader::stringField(const std::string& name) const
{
  size_t pos = field(name, MessageWrapper::String);
  return readString(&pos);
}

std::vector<std::string> MessageReader::stringsField(const std::string& name) const
{
  size_t pos = field(name, MessageWrapper::Strings);
  int num = readInt(&pos);
  vector<string> strings;
  for (int i = 0; i < num; ++i)
    strings.push_back(readString(&pos));
  return strings;
}

Eigen::ArrayXd MessageReader::arrayField(const std::string& name) const
{
  size_t pos = field(name, MessageWrapper::ArrayXd);
  int num = readInt(&pos);
  Eigen::ArrayXd arr(num);
  memcpy(arr.data(), data_.data() + pos, size_t(num) * 8);
  return arr;
}

Eigen::ArrayXXd MessageReader::matrixField(const std::string& name) const
{
  size_t pos = field(name, MessageWrapper::ArrayXXd);
  int rows = readInt(&pos);
  int cols = readInt(&pos);
  Eigen::ArrayXXd arr(rows, cols);
  memcpy(arr.data(), data_.data() + pos, size_t(rows) * cols * 8);
  return arr;
}

WorkerPool::WorkerPool(int num_workers, const HandlerFactory& factory) :
  sock_jobs_(ctx_, zmq::socket_type::push),
  sock_results_(ctx_, zmq::socket_type::pull)
{
  if (num_workers < 1)
    throw std::invalid_argument(fmt::format("WorkerPool needs at least one worker, got {}.", num_workers));

  sock_jobs_.set(zmq::sockopt::linger, 0);
  sock_results_.set(zmq::sockopt::linger, 0);
  sock_jobs_.bind(kJobsEndpoint);
  sock_results_.bind(kResultsEndpoint);

  std::vector<Handler> handlers;
  for (int i = 0; i < num_workers; ++i)
    handlers.push_back(factory());
  for (Handler& handler : handlers)
    threads_.emplace_back(&WorkerPool::work, this, std::move(handler));
}

WorkerPool::~WorkerPool()
{
  sock_jobs_.close();
  sock_results_.close();
  // Wakes up every worker blocked in recv() with ETERM.
  ctx_.shutdown();
  for (std::thread& thread : threads_)
    thread.join();
}

std::vector<MessageReader> WorkerPool::map(const std::vector<MessageWrapper>& jobs)
{
  std::lock_guard<std::mutex> lock(mutex_);

  for (size_t i = 0; i < jobs.size(); ++i) {
    uint32_t idx = i;
    sock_jobs_.send(zmq::buffer(&idx, sizeof(idx)), zmq::send_flags::sndmore);
    sock_jobs_.send(jobs[i], zmq::send_flags::none);
  }

  // Every result is read before anything is thrown, so nothing is left queued for the next call.
  vector<vector<uint8_t>> results(jobs.size());
  string error;
  for (size_t num_received = 0; num_received < jobs.size(); ++num_received) {
    zmq::message_t idx_msg;
    zmq::message_t payload;
    if (!sock_results_.recv(idx_msg, zmq::recv_flags::none) || !sock_results_.recv(payload, zmq::recv_flags::none))
      throw std::runtime_error("WorkerPool: failed to receive a result.");
    uint32_t idx;
    if (idx_msg.size() != sizeof(idx)) {
      if (error.empty())
        error = fmt::format("bad job index frame of {} bytes.", idx_msg.size());
      continue;
    }
    memcpy(&idx, idx_msg.data(), sizeof(idx));
    if (idx >= results.size()) {
      if (error.empty())
        error = fmt::format("job index {} out of range.", idx);
      continue;
    }
    results[idx].assign(payload.data<uint8_t>(), payload.data<uint8_t>() + payload.size());
  }
  if (!error.empty())
    throw std::runtime_error("WorkerPool: " + error);

  vector<MessageReader> readers;
  for (size_t i = 0; i < results.size(); ++i) {
    readers.emplace_back(results[i]);
    if (error.empty() && readers.back().hasField("error"))
      error = fmt::format("job {}: {}", i, readers.back().stringField("error"));
  }
  if (!error.empty())
    throw std::runtime_error("WorkerPool: " + error);
  return readers;
}

void WorkerPool::work(Handler handler)
{
  zmq::socket_t jobs(ctx_, zmq::socket_type::pull);
  zmq::socket_t results(ctx_, zmq::socket_type::push);
  jobs.set(zmq::sockopt::linger, 0);
  results.set(zmq::sockopt::linger, 0);

  try {
    jobs.connect(kJobsEndpoint);
    results.connect(kResultsEndpoint);

    while (true) {
      zmq::message_t idx_msg;
      zmq::message_t payload;
      if (!jobs.recv(idx_msg, zmq::recv_flags::none) || !jobs.recv(payload, zmq::recv_flags::none))
        continue;

      MessageWrapper response;
      try {
        response = handler(MessageReader(payload));
      }
      catch (const std::exception& e) {
        response = MessageWrapper();
        response.addField("error", string(e.what()));
      }
      results.send(idx_msg, zmq::send_flags::sndmore);
      results.send(response, zmq::send_flags::none);
    }
  }
  catch (const zmq::error_t& e) {
    // ETERM is the normal shutdown path.
    if (e.num() != ETERM)
      cerr << "[WorkerPool] worker exiting on zmq error: " << e.what() << endl;
  }
}
