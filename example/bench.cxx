#include <fcntl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <args.hxx>
#include <array>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "codec/serializer.hxx"
#include "codec/sink.hxx"
#include "util/fatal.hxx"
#include "util/logger.hxx"
#include "util/timer.hxx"

template <typename... T>
constexpr inline auto make_array(T&&... values)
    -> std::array<typename std::decay<typename std::common_type<T...>::type>::type, sizeof...(T)> {
  return {std::forward<T>(values)...};
}

std::string human_readable_bytes(double bytes) {
  constexpr static auto units = make_array("B", "KB", "MB", "GB", "TB", "PB");
  for (auto i = 0uz; i < units.size(); ++i) {
    if (bytes < 1024.) {
      return std::format("{:.2f}{}", bytes, units[i]);
    }
    bytes /= 1024.;
  }
  return std::format("{:.2f}{}", bytes, units.back());
}

struct Item {
  std::string sku;
  int64_t quantity;
  double price;
};

struct Order {
  uint64_t id;
  std::string customer;
  std::vector<Item> items;
  std::map<std::string, std::string> tags;
  std::optional<std::string> note;
  Order* parent = nullptr;
};

template <>
struct gpk::codec::BeanTraits<Item> {
  static void properties(const Item& i, PropertyList& l) {
    l.add("sku", i.sku).add("quantity", i.quantity).add("price", i.price);
  }
};

template <>
struct gpk::codec::BeanTraits<Order> {
  static void properties(const Order& o, PropertyList& l) {
    l.add("id", o.id)
        .add("customer", o.customer)
        .add("items", o.items)
        .add("tags", o.tags)
        .add("note", o.note)
        .add("parent", o.parent);
  }
  static std::string_view type_name(const Order&) { return "order"; }
};

args::ArgumentParser p("graphpack Encode Benchmark");
args::HelpFlag help(p, "help", "display this help menu", {'h', "help"});
args::ValueFlag<std::string> options_file(p, "options", "serializer options, in json", {"options"}, "");
args::ValueFlag<std::string> output(p, "output", "file receiving the encoded bytes of every round", {"output"}, "");
args::ValueFlag<uint32_t> n_thread(p, "n thread", "n thread", {"n_thread"}, 1);
args::ValueFlag<uint32_t> n_round(p, "n round", "serializations per thread", {"n_round"}, 100);
args::ValueFlag<uint32_t> n_order(p, "n order", "orders in the graph", {"n_order"}, 1000);
args::ValueFlag<uint32_t> n_item(p, "n item", "items per order", {"n_item"}, 8);
args::Flag verbose(p, "verbose", "log at debug level", {'v', "verbose"}, false);

void parse_args(int argc, char* argv[]) {
  try {
    p.ParseCLI(argc, argv);
  } catch (const args::Help&) {
    std::cout << p;
    exit(0);
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl << std::endl << p;
    exit(-1);
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl << std::endl << p;
    exit(-1);
  }
}

gpk::codec::Options load_options() {
  auto path = args::get(options_file);
  if (path.empty()) {
    return {};
  }
  std::ifstream in(path);
  if (!in) {
    die("Fail to open options file {}", path);
  }
  std::stringstream json;
  json << in.rdbuf();
  auto o = gpk::codec::Options::from_json(json.str());
  if (!o.has_value()) {
    die("Invalid options file {}", path);
  }
  return std::move(o).value();
}

std::vector<Order> generate_orders() {
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int64_t> quantity(1, 1000);
  std::uniform_real_distribution<double> price(0.5, 500.);
  std::vector<Order> orders(args::get(n_order));
  for (auto i = 0uz; i < orders.size(); ++i) {
    auto& o = orders[i];
    o.id = i;
    o.customer = std::format("customer-{}", rng() % 10000);
    for (auto j = 0uz; j < args::get(n_item); ++j) {
      o.items.push_back({std::format("sku-{:08}", rng() % 100000000), quantity(rng), price(rng)});
    }
    o.tags = {{"region", i % 2 == 0 ? "east" : "west"}, {"channel", "web"}};
    if (i % 3 == 0) {
      o.note = "gift wrap";
    }
    // the first order is shared by every other one and refers to itself
    o.parent = &orders[0];
  }
  return orders;
}

size_t run_rounds(const gpk::codec::Options& options, const std::vector<Order>& orders, gpk::codec::Sink& out) {
  gpk::codec::Serializer s(options);
  auto n = 0uz;
  for (auto i = 0uz; i < args::get(n_round); ++i) {
    n += s.serialize(orders, out);
  }
  if (!s.warnings().empty()) {
    WARN("{} getter failures in the last round", s.warnings().size());
  }
  return n;
}

int main(int argc, char* argv[]) {
  parse_args(argc, argv);
  spdlog::set_level(args::get(verbose) ? spdlog::level::debug : spdlog::level::info);

  auto options = load_options();
  auto orders = generate_orders();
  INFO("Generated {} orders with {} items each", orders.size(), args::get(n_item));

  std::vector<std::future<std::pair<size_t, uint64_t>>> result_fs;
  for (auto i = 0uz; i < args::get(n_thread); ++i) {
    result_fs.emplace_back(std::async(std::launch::async, [&, i]() {
      gpk::Timer t;
      size_t n = 0;
      if (auto path = args::get(output); !path.empty()) {
        auto fd = ::open(std::format("{}.{}", path, i).c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd < 0) {
          die("Fail to open {}.{}, errno: {}", path, i, errno);
        }
        gpk::codec::FdSink out(fd, true);
        n = run_rounds(options, orders, out);
      } else {
        gpk::codec::VectorSink out;
        n = run_rounds(options, orders, out);
      }
      return std::make_pair(n, t.elapsed_us());
    }));
  }

  for (auto i = 0uz; i < result_fs.size(); ++i) {
    auto [n, us] = result_fs[i].get();
    INFO("thread {}: {} in {}us, {}/s", i, human_readable_bytes(n), us,
         human_readable_bytes(n * 1e6 / std::max<uint64_t>(us, 1)));
  }
  return 0;
}
