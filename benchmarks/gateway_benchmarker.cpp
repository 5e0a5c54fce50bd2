#include <conduit/common/util.hpp>
#include <conduit/gateway/config.hpp>
#include <conduit/gateway/gateway.hpp>
#include <conduit/messaging/channel.hpp>
#include <conduit/messaging/executor.hpp>

#include <chrono>
#include <fstream>
#include <future>
#include <string>
#include <vector>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

using namespace conduit;

struct Config {

  int repetitions;
  int payload_size;
  int threads;

  std::string output_file;

  gateway::config::Gateway gateway;

  void load(cereal::JSONInputArchive& archive)
  {
    archive(cereal::make_nvp("repetitions", repetitions));
    archive(cereal::make_nvp("payload-size", payload_size));
    archive(cereal::make_nvp("threads", threads));
    archive(cereal::make_nvp("output-file", output_file));

    common::util::cereal_load_optional(archive, "gateway", gateway);
  }
};

void echo(const messaging::MessagePtr& msg)
{
  auto reply = messaging::MessageBuilder::with_payload(msg->payload()).build();
  msg->reply_channel()->send(reply);
}

template <typename F>
std::vector<long> measure(int repetitions, F&& invoke)
{
  std::vector<long> measurements;
  for (int i = 0; i < repetitions; ++i) {

    auto begin = std::chrono::high_resolution_clock::now();
    invoke();
    auto end = std::chrono::high_resolution_clock::now();

    measurements.emplace_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - begin).count()
    );
  }
  return measurements;
}

int main(int argc, char** argv)
{
  cxxopts::Options options("conduit-gateway-benchmarker", "Measure the latency of gateway invocations.");
  options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>())(
      "v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false")
  );
  auto parsed_options = options.parse(argc, argv);

  std::string config_file{parsed_options["config"].as<std::string>()};
  std::ifstream in_stream{config_file};
  if (!in_stream.is_open()) {
    spdlog::error("Could not open config file {}", config_file);
    return 1;
  }

  Config cfg;
  cereal::JSONInputArchive archive_in(in_stream);
  cfg.load(archive_in);

  if (parsed_options["verbose"].as<bool>() || cfg.gateway.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing gateway benchmarker!");

  auto direct = std::make_shared<messaging::DirectChannel>("direct-echo");
  direct->subscribe(echo);

  auto pool = std::make_shared<messaging::ThreadPoolExecutor>(cfg.threads);
  auto async = std::make_shared<messaging::ExecutorChannel>("executor-echo", pool);
  async->subscribe(echo);

  messaging::ChannelResolver channels;
  channels.add(direct);
  channels.add(async);

  gateway::config::Method blocking_cfg;
  blocking_cfg.request_channel = "direct-echo";
  gateway::config::Method future_cfg;
  future_cfg.request_channel = "executor-echo";

  auto gw = gateway::GatewayFactory{cfg.gateway, channels}
                .method<std::string(std::string)>("blocking", blocking_cfg)
                .method<std::future<std::string>(std::string)>("future", future_cfg)
                .build();

  auto blocking = gw.invoker<std::string(std::string)>("blocking");
  auto future = gw.invoker<std::future<std::string>(std::string)>("future");

  std::string payload(cfg.payload_size, 'x');

  std::vector<std::pair<std::string, std::vector<long>>> measurements;
  measurements.emplace_back("blocking", measure(cfg.repetitions, [&]() { blocking(payload); }));
  measurements.emplace_back("future", measure(cfg.repetitions, [&]() { future(payload).get(); }));

  std::ofstream out_file{cfg.output_file, std::ios::out};
  out_file << "mode, repetition, time" << '\n';
  for (auto& [mode, values] : measurements) {
    for (size_t i = 0; i < values.size(); ++i) {
      out_file << mode << "," << i << "," << values[i] << '\n';
    }
  }
  out_file.close();

  pool->wait();

  return 0;
}
