/*
 * Eqv - Deep structural equivalence of object graphs
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include "eqv/equivalence.hpp"
#include "eqv/exceptions.hpp"
#include "eqv/logging.hpp"
#include "eqv/type.hpp"
#include "eqv/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>


namespace {

// Exit statuses besides EXIT_SUCCESS
constexpr int status_mismatch = 1;
constexpr int status_unsupported_shape = 2;
constexpr int status_type_error = 3;
constexpr int status_usage = 64;

struct scenario {
  std::string description;
  std::function<std::pair<eqv::value, eqv::value>()> build;
};


const eqv::type*
line_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Line"}
      .field("Sku", eqv::string_type())
      .field("Quantity", eqv::integer_type())
      .define();
  return t;
}

const eqv::type*
order_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Order"}
      .field("Id", eqv::integer_type())
      .field("Lines", eqv::sequence_type())
      .property("LineCount", eqv::integer_type(), [](eqv::value self) {
        return eqv::integer(seq_length(get_field(self, "Lines")));
      })
      .define();
  return t;
}

const eqv::type*
node_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Node"}
      .field("Label", eqv::string_type())
      .field("Next", std::string {"Demo.Node"})
      .define();
  return t;
}

const eqv::type*
animal_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Animal"}
      .field("Name", eqv::string_type())
      .define();
  return t;
}

const eqv::type*
dog_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Dog"}
      .base(animal_type())
      .field("Breed", eqv::string_type())
      .define();
  return t;
}

const eqv::type*
kennel_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Kennel"}
      .field("Resident", animal_type())
      .define();
  return t;
}

// Claims to yield integers
const eqv::type*
gauge_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Gauge"}
      .property("Reading", eqv::integer_type(), [](eqv::value) {
        return eqv::str("n/a");
      })
      .define();
  return t;
}

const eqv::type*
grid_type()
{
  static const eqv::type *t = eqv::type_builder {"Demo.Grid"}
      .field("Cells", eqv::sequence_type())
      .indexer("Item", eqv::integer_type(), {eqv::integer_type()},
               [](eqv::value self, std::span<const eqv::value> index) {
                 return seq_ref(get_field(self, "Cells"),
                                int_val(index.front()));
               })
      .define();
  return t;
}


eqv::value
make_order(int64_t id, std::initializer_list<std::pair<const char*, int>> lines)
{
  const eqv::value seq = eqv::make_sequence();
  for (const auto &[sku, quantity] : lines)
    push_back(seq, eqv::make_object(line_type(), {{"Sku", eqv::from(sku)},
                                                  {"Quantity", eqv::from(quantity)}}));
  return eqv::make_object(order_type(), {{"Id", eqv::from(id)}, {"Lines", seq}});
}

eqv::value
make_ring(std::initializer_list<const char*> labels)
{
  eqv::value first = eqv::nil, last = eqv::nil;
  for (const char *label : labels)
  {
    const eqv::value node =
        eqv::make_object(node_type(), {{"Label", eqv::from(label)}});
    if (isnil(first))
      first = node;
    else
      set_field(last, "Next", node);
    last = node;
  }
  set_field(last, "Next", first);
  return first;
}

eqv::value
make_kennel(const char *name, const char *breed)
{
  const eqv::value dog = eqv::make_object(
      dog_type(), {{"Name", eqv::from(name)}, {"Breed", eqv::from(breed)}});
  return eqv::make_object(kennel_type(), {{"Resident", dog}});
}


std::map<std::string, scenario>
make_scenarios()
{
  std::map<std::string, scenario> ret;

  ret.emplace("orders", scenario {
      "two equal orders",
      [] { return std::pair {make_order(1, {{"A-1", 2}, {"B-7", 1}}),
                             make_order(1, {{"A-1", 2}, {"B-7", 1}})}; }});

  ret.emplace("order-quantity", scenario {
      "orders differing in the quantity of a line",
      [] { return std::pair {make_order(1, {{"A-1", 2}, {"B-7", 3}}),
                             make_order(1, {{"A-1", 2}, {"B-7", 1}})}; }});

  ret.emplace("order-count", scenario {
      "orders with different number of lines",
      [] { return std::pair {make_order(1, {{"A-1", 2}, {"B-7", 1}}),
                             make_order(1, {{"A-1", 2}})}; }});

  ret.emplace("ring", scenario {
      "two rings of nodes with equal labels",
      [] { return std::pair {make_ring({"a", "b", "c"}),
                             make_ring({"a", "b", "c"})}; }});

  ret.emplace("ring-label", scenario {
      "two rings of nodes differing in one label",
      [] { return std::pair {make_ring({"a", "b", "c"}),
                             make_ring({"a", "x", "c"})}; }});

  ret.emplace("kennel", scenario {
      "dogs of different breeds behind a member declared as Demo.Animal "
      "(equivalent unless --runtime-types)",
      [] { return std::pair {make_kennel("Rex", "Beagle"),
                             make_kennel("Rex", "Poodle")}; }});

  ret.emplace("grid", scenario {
      "objects exposing an indexer",
      [] {
        return std::pair {
            eqv::make_object(grid_type(), {{"Cells", eqv::sequence(1, 2)}}),
            eqv::make_object(grid_type(), {{"Cells", eqv::sequence(1, 2)}})};
      }});

  ret.emplace("gauge", scenario {
      "property returning a value of a wrong type",
      [] { return std::pair {eqv::make_object(gauge_type()),
                             eqv::make_object(gauge_type())}; }});

  ret.emplace("strings", scenario {
      "strings differing in case",
      [] { return std::pair {eqv::str("abc"), eqv::str("Abc")}; }});

  return ret;
}

} // anonymous namespace


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace eqv;

  std::string verbosity {loglevel_name(loglevel::warning)};
  std::string message;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help", "produce help message")
    ("list", "list available scenarios")
    ("scenario", po::value<std::string>(), "scenario to run")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity")
    ("runtime-types", "compare members using runtime types")
    ("message,m", po::value<std::string>(&message), "custom message for failures");

  po::positional_options_description posdesc;
  posdesc.add("scenario", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);

    // Set global log-level
    loglevel = parse_loglevel(verbosity);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return status_usage;
  }
  catch (const std::runtime_error &e)
  {
    error("{}", e.what());
    return status_usage;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] <scenario>" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  const std::map<std::string, scenario> scenarios = make_scenarios();

  if (varmap.contains("list") or not varmap.contains("scenario"))
  {
    for (const auto &[name, s] : scenarios)
      std::cout << name << " - " << s.description << std::endl;
    return varmap.contains("list") ? EXIT_SUCCESS : status_usage;
  }

  const std::string name = varmap["scenario"].as<std::string>();
  const auto it = scenarios.find(name);
  if (it == scenarios.end())
  {
    error("no such scenario: {}", name);
    return status_usage;
  }

  equivalency_options options;
  options.compare_using_runtime_types = varmap.contains("runtime-types");

  std::optional<std::string_view> custom_message;
  if (varmap.contains("message"))
    custom_message = message;

  int status = EXIT_SUCCESS;
  try
  {
    execution_timer timer {name};
    const auto [actual, expected] = it->second.build();
    should_be_equivalent_to(actual, expected, options, custom_message);
    timer.stop();
    std::cout << "equivalent" << std::endl;
  }
  catch (const equivalence_mismatch &exn)
  {
    std::cout << exn.what() << std::endl;
    status = status_mismatch;
  }
  catch (const unsupported_shape &exn)
  {
    error("{}", exn.what());
    status = status_unsupported_shape;
  }
  catch (const type_error &exn)
  {
    error("{}", exn.what());
    status = status_type_error;
  }

  execution_timer::report_global_stats();

  return status;
}
