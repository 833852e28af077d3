#pragma once

#include <string>
#include <string_view>

namespace netstack::topology {

// Role suffixes of the `<prefix>-<role>` naming contract. Teardown and
// collect locate a topology only through the VPC name.
inline constexpr std::string_view kRoleVpc = "vpc";
inline constexpr std::string_view kRolePublicSubnet = "public-subnet";
inline constexpr std::string_view kRolePrivateSubnet = "private-subnet";
inline constexpr std::string_view kRoleInternetGateway = "igw";
inline constexpr std::string_view kRoleNatGateway = "natgw";
inline constexpr std::string_view kRoleMainRouteTable = "main-RTB";
inline constexpr std::string_view kRolePrivateRouteTable = "rtb-private";
inline constexpr std::string_view kRolePublicSecurityGroup = "sg-public";
inline constexpr std::string_view kRolePrivateSecurityGroup = "sg-private";
inline constexpr std::string_view kRolePublicInstance = "ec2-public";
inline constexpr std::string_view kRolePrivateInstance = "ec2-private";

inline constexpr std::size_t kMaxPrefixLength = 64;

inline std::string ResourceName(std::string_view prefix, std::string_view role) {
  std::string name(prefix);
  name += '-';
  name += role;
  return name;
}

inline std::string VpcName(std::string_view prefix) {
  return ResourceName(prefix, kRoleVpc);
}

// Accepts non-empty prefixes of ASCII letters, digits and '-', at most
// kMaxPrefixLength characters. Security group names and tag values derive
// from the prefix, so the charset stays within what both accept.
bool ValidatePrefix(std::string_view prefix, std::string& error);

} // namespace netstack::topology
