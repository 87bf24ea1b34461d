#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "hash/dynamic.hpp"
#include "hash/hash.hpp"

namespace {

struct Address {
  std::string street;
  std::string city;
};

struct Account {
  std::string id;
  std::string name;
  std::vector<std::string> emails;
  std::unique_ptr<Address> address;
  std::chrono::system_clock::time_point created;
  std::map<std::string, entt::meta_any> metadata;
  std::string session_token;
};

}  // namespace

namespace sh::hash {

template <>
struct record_traits<Address> {
  static constexpr auto describe() {
    return record<Address>("Address").field("Street", &Address::street).field("City", &Address::city);
  }
};

template <>
struct record_traits<Account> {
  static constexpr auto describe() {
    return record<Account>("Account")
        .field("Id", &Account::id, ignore)
        .field("Name", &Account::name)
        .field("Emails", &Account::emails, as_set)
        .field("Address", &Account::address)
        .field("Created", &Account::created)
        .field("Metadata", &Account::metadata)
        .unexported("sessionToken", &Account::session_token);
  }
};

}  // namespace sh::hash

namespace {

auto make_account(std::string id, std::vector<std::string> emails) -> Account {
  Account account;
  account.id = std::move(id);
  account.name = "Ada";
  account.emails = std::move(emails);
  account.address = std::make_unique<Address>(Address{"1 Loop", "London"});
  account.created = std::chrono::sys_days{std::chrono::year{2024} / 3 / 1};
  account.metadata.emplace("plan", std::string("pro"));
  account.metadata.emplace("seats", std::int64_t{5});
  return account;
}

}  // namespace

int main() {
  sh::hash::register_builtin_types();

  auto first = make_account("a-1", {"ada@example.com", "lovelace@example.com"});
  auto second = make_account("a-2", {"lovelace@example.com", "ada@example.com"});
  second.session_token = "ephemeral";

  for (auto format : {sh::hash::Format::Md5, sh::hash::Format::Blake3, sh::hash::Format::Xxh3}) {
    auto a = sh::hash::hash(first, format);
    auto b = sh::hash::hash(second, format);
    if (!a || !b) {
      std::cerr << std::format("hash failed: {}\n", (!a ? a.error() : b.error()).message);
      return 1;
    }
    std::cout << std::format("{:6} {} {}\n", sh::hash::format_name(format), sh::hash::to_hex(*a),
                             *a == *b ? "(equal)" : "(different)");
  }
  return 0;
}
