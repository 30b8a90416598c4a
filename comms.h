#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <Eigen/Dense>
#include <zmq.hpp>

// https://github.com/zeromq/cppzmq

class MessageWrapper
{
public:
  enum dtype {
    String=10,
    Strings=11,
    ArrayXd=12,
    ArrayXXd=13,
    Int=14
  };

  MessageWrapper() { data_.push_back(kMagic); }
  operator zmq::message_t () const { return zmq::message_t(data_); }
  size_t size() const { return data_.size(); }
  const std::vector<uint8_t>& data() const { return data_; }

  void addField(const std::string& name, int val);
  void addField(const std::string& name, const std::string& str);
  void addField(const std::string& name, const Eigen::ArrayXd& arr);
  void addField(const std::string& name, const Eigen::ArrayXXd& arr);
  void addField(const std::string& name, const std::vector<std::string>& strings);

  static constexpr uint8_t kMagic = 13;  // magic number

private:
  std::vector<uint8_t> data_;

  void append(dtype val) { data_.push_back(val); }
  void append(int val);
  void append(const std::string& str);
  void append(const std::vector<std::string>& strings);
};

// Parses what MessageWrapper writes.  Owns a copy of the bytes.
class MessageReader
{
public:
  MessageReader(const std::vector<uint8_t>& data);
  MessageReader(const zmq::message_t& msg);

  bool hasField(const std::string& name) const { return fields_.find(name) != fields_.end(); }
  int intField(const std::string& name) const;
  std::string stringField(const std::string& name) const;
  std::vector<std::string> stringsField(const std::string& name) const;
  Eigen::ArrayXd arrayField(const std::string& name) const;
  Eigen::ArrayXXd matrixField(const std::string& name) const;

private:
  std::vector<uint8_t> data_;
  // name -> (type, offset of the payload)
  std::map<std::string, std::pair<MessageWrapper::dtype, size_t>> fields_;

  void parse();
  size_t field(const std::string& name, MessageWrapper::dtype type) const;
  int readInt(size_t* pos) const;
  std::string readString(size_t* pos) const;
  void require(size_t pos, size_t num_bytes) const;
};

// Fixed set of worker threads fed through inproc PUSH/PULL sockets.
// Workers see nothing but the bytes of the messages they are sent, plus their own handler.
class WorkerPool
{
public:
  typedef std::function<MessageWrapper(const MessageReader&)> Handler;
  typedef std::function<Handler()> HandlerFactory;

  // factory is called once per worker so each gets private state.
  WorkerPool(int num_workers, const HandlerFactory& factory);
  ~WorkerPool();

  int numWorkers() const { return threads_.size(); }
  // Blocks until every job is answered.  Results are in job order.
  // A job whose handler threw is re-raised here as std::runtime_error, after all results are in.
  std::vector<MessageReader> map(const std::vector<MessageWrapper>& jobs);

private:
  zmq::context_t ctx_;
  zmq::socket_t sock_jobs_;
  zmq::socket_t sock_results_;
  std::vector<std::thread> threads_;
  std::mutex mutex_;

  void work(Handler handler);
};
