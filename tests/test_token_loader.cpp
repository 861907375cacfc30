#include "token_loader.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using ghv::load_tokens_from_file;

TEST_CASE("token files in every format") {
  {
    std::ofstream f("tok.json");
    f << R"({"token": "a", "tokens": ["b", " a ", ""]})";
  }
  REQUIRE(load_tokens_from_file("tok.json") ==
          std::vector<std::string>{"a", "b"});

  {
    std::ofstream f("tok.yml");
    f << "- x\n- y\n- x\n";
  }
  REQUIRE(load_tokens_from_file("tok.yml") ==
          std::vector<std::string>{"x", "y"});

  {
    std::ofstream f("tok.toml");
    f << "token = \"t\"\n";
    f << "tokens = [\"u\", \"v\"]\n";
  }
  REQUIRE(load_tokens_from_file("tok.toml") ==
          std::vector<std::string>{"t", "u", "v"});

  {
    std::ofstream f("tok_bad.json");
    f << R"({"tokens": "not-a-list"})";
  }
  REQUIRE_THROWS_AS(load_tokens_from_file("tok_bad.json"), std::runtime_error);
  REQUIRE_THROWS_AS(load_tokens_from_file("tokens.txt"), std::runtime_error);
  REQUIRE_THROWS_AS(load_tokens_from_file("tokens"), std::runtime_error);

  std::remove("tok.json");
  std::remove("tok.yml");
  std::remove("tok.toml");
  std::remove("tok_bad.json");
}
