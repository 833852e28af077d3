#include "cloud/sim/sim_state_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cmath>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace netstack::cloud::sim {

namespace {

using JsonValue = core::json::Value;
using core::JsonWriter;

constexpr std::string_view kSchemaVersion = "2";

void WriteTags(JsonWriter& out, const TagList& tags) {
  out.Key("tags").BeginArray();
  for (const auto& tag : tags) {
    out.BeginObject().StringField("key", tag.key).StringField("value", tag.value).EndObject();
  }
  out.EndArray();
}

void WritePermission(JsonWriter& out, const IpPermission& permission) {
  out.BeginObject()
      .StringField("ip_protocol", permission.ip_protocol)
      .IntField("from_port", permission.from_port)
      .IntField("to_port", permission.to_port)
      .StringArrayField("cidr_ranges", permission.cidr_ranges)
      .StringArrayField("source_group_ids", permission.source_group_ids)
      .EndObject();
}

void WriteCounters(JsonWriter& out, std::string_view key,
                   const std::map<std::string, std::uint32_t>& counters) {
  out.Key(key).BeginObject();
  for (const auto& [id, remaining] : counters) {
    out.UIntField(id, remaining);
  }
  out.EndObject();
}

// Field readers. Each one names the offending key so a corrupted state file
// is easy to locate.
const JsonValue* RequireField(const JsonValue& object, std::string_view key,
                              JsonValue::Type type, std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    error = "missing required field '" + std::string(key) + "'";
    return nullptr;
  }
  if (field->type != type) {
    error = "field '" + std::string(key) + "' must be " + core::json::TypeName(type) +
            " but was " + core::json::TypeName(field->type);
    return nullptr;
  }
  return field;
}

bool ReadString(const JsonValue& object, std::string_view key, std::string& value,
                std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kString, error);
  if (field == nullptr) {
    return false;
  }
  value = field->string_value;
  return true;
}

bool ReadBool(const JsonValue& object, std::string_view key, bool& value, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kBool, error);
  if (field == nullptr) {
    return false;
  }
  value = field->bool_value;
  return true;
}

bool ReadUnsigned(const JsonValue& object, std::string_view key, std::uint64_t& value,
                  std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kNumber, error);
  if (field == nullptr) {
    return false;
  }
  if (!core::json::TryGetUnsigned(*field, value)) {
    error = "field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  return true;
}

bool ReadPort(const JsonValue& object, std::string_view key, std::int32_t& value,
              std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kNumber, error);
  if (field == nullptr) {
    return false;
  }
  const double number = field->number_value;
  if (!std::isfinite(number) || std::floor(number) != number || number < -1.0 ||
      number > 65535.0) {
    error = "field '" + std::string(key) + "' must be a port number";
    return false;
  }
  value = static_cast<std::int32_t>(number);
  return true;
}

bool ReadStringArray(const JsonValue& object, std::string_view key,
                     std::vector<std::string>& values, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kArray, error);
  if (field == nullptr) {
    return false;
  }
  values.clear();
  for (const auto& item : field->array_value) {
    if (!item.IsString()) {
      error = "field '" + std::string(key) + "' must contain only strings";
      return false;
    }
    values.push_back(item.string_value);
  }
  return true;
}

template <typename Item, typename ParseItem>
bool ReadArray(const JsonValue& object, std::string_view key, std::vector<Item>& items,
               ParseItem parse_item, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kArray, error);
  if (field == nullptr) {
    return false;
  }
  items.clear();
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& element = field->array_value[i];
    if (!element.IsObject()) {
      error = std::string(key) + "[" + std::to_string(i) + "] must be an object";
      return false;
    }
    Item item;
    if (!parse_item(element, item, error)) {
      error = std::string(key) + "[" + std::to_string(i) + "]: " + error;
      return false;
    }
    items.push_back(std::move(item));
  }
  return true;
}

// Loads an array of records into an ID-keyed map.
template <typename Item, typename ParseItem, typename IdOf>
bool ReadRecordMap(const JsonValue& object, std::string_view key,
                   std::map<std::string, Item>& records, ParseItem parse_item, IdOf id_of,
                   std::string& error) {
  std::vector<Item> items;
  if (!ReadArray(object, key, items, parse_item, error)) {
    return false;
  }
  records.clear();
  for (auto& item : items) {
    std::string id = id_of(item);
    if (!records.emplace(id, std::move(item)).second) {
      error = std::string(key) + " contains duplicate id '" + id + "'";
      return false;
    }
  }
  return true;
}

bool ReadCounters(const JsonValue& object, std::string_view key,
                  std::map<std::string, std::uint32_t>& counters, std::string& error) {
  const JsonValue* field = RequireField(object, key, JsonValue::Type::kObject, error);
  if (field == nullptr) {
    return false;
  }
  counters.clear();
  for (const auto& [id, value] : field->object_value) {
    std::uint64_t remaining = 0;
    if (!core::json::TryGetUnsigned(value, remaining) ||
        remaining > std::numeric_limits<std::uint32_t>::max()) {
      error = std::string(key) + "." + id + " must be a small non-negative integer";
      return false;
    }
    counters.emplace(id, static_cast<std::uint32_t>(remaining));
  }
  return true;
}

bool ParseTag(const JsonValue& value, Tag& tag, std::string& error) {
  return ReadString(value, "key", tag.key, error) && ReadString(value, "value", tag.value, error);
}

bool ReadTags(const JsonValue& object, TagList& tags, std::string& error) {
  return ReadArray(object, "tags", tags, ParseTag, error);
}

bool ParsePermission(const JsonValue& value, IpPermission& permission, std::string& error) {
  return ReadString(value, "ip_protocol", permission.ip_protocol, error) &&
         ReadPort(value, "from_port", permission.from_port, error) &&
         ReadPort(value, "to_port", permission.to_port, error) &&
         ReadStringArray(value, "cidr_ranges", permission.cidr_ranges, error) &&
         ReadStringArray(value, "source_group_ids", permission.source_group_ids, error);
}

bool ParseVpc(const JsonValue& value, Vpc& vpc, std::string& error) {
  return ReadString(value, "vpc_id", vpc.vpc_id, error) &&
         ReadString(value, "cidr_block", vpc.cidr_block, error) &&
         ReadString(value, "state", vpc.state, error) &&
         ReadBool(value, "is_default", vpc.is_default, error) && ReadTags(value, vpc.tags, error);
}

bool ParseSubnet(const JsonValue& value, Subnet& subnet, std::string& error) {
  return ReadString(value, "subnet_id", subnet.subnet_id, error) &&
         ReadString(value, "vpc_id", subnet.vpc_id, error) &&
         ReadString(value, "cidr_block", subnet.cidr_block, error) &&
         ReadString(value, "availability_zone", subnet.availability_zone, error) &&
         ReadString(value, "state", subnet.state, error) &&
         ReadBool(value, "map_public_ip_on_launch", subnet.map_public_ip_on_launch, error) &&
         ReadTags(value, subnet.tags, error);
}

bool ParseGatewayAttachment(const JsonValue& value, InternetGatewayAttachment& attachment,
                            std::string& error) {
  return ReadString(value, "vpc_id", attachment.vpc_id, error) &&
         ReadString(value, "state", attachment.state, error);
}

bool ParseInternetGateway(const JsonValue& value, InternetGateway& gateway, std::string& error) {
  return ReadString(value, "internet_gateway_id", gateway.internet_gateway_id, error) &&
         ReadArray(value, "attachments", gateway.attachments, ParseGatewayAttachment, error) &&
         ReadTags(value, gateway.tags, error);
}

bool ParseAddress(const JsonValue& value, Address& address, std::string& error) {
  return ReadString(value, "allocation_id", address.allocation_id, error) &&
         ReadString(value, "public_ip", address.public_ip, error) &&
         ReadString(value, "association_id", address.association_id, error) &&
         ReadString(value, "network_interface_id", address.network_interface_id, error);
}

bool ParseNatAddress(const JsonValue& value, NatGatewayAddress& address, std::string& error) {
  return ReadString(value, "allocation_id", address.allocation_id, error) &&
         ReadString(value, "network_interface_id", address.network_interface_id, error) &&
         ReadString(value, "public_ip", address.public_ip, error) &&
         ReadString(value, "private_ip", address.private_ip, error);
}

bool ParseNatGateway(const JsonValue& value, NatGateway& gateway, std::string& error) {
  std::string state_text;
  if (!ReadString(value, "nat_gateway_id", gateway.nat_gateway_id, error) ||
      !ReadString(value, "vpc_id", gateway.vpc_id, error) ||
      !ReadString(value, "subnet_id", gateway.subnet_id, error) ||
      !ReadString(value, "state", state_text, error) ||
      !ReadArray(value, "addresses", gateway.addresses, ParseNatAddress, error) ||
      !ReadTags(value, gateway.tags, error)) {
    return false;
  }
  if (!ParseNatGatewayState(state_text, gateway.state)) {
    error = "unsupported NAT gateway state '" + state_text + "'";
    return false;
  }
  return true;
}

bool ParseAssociation(const JsonValue& value, RouteTableAssociation& association,
                      std::string& error) {
  return ReadString(value, "association_id", association.association_id, error) &&
         ReadString(value, "route_table_id", association.route_table_id, error) &&
         ReadString(value, "subnet_id", association.subnet_id, error) &&
         ReadBool(value, "main", association.main, error);
}

bool ParseRoute(const JsonValue& value, Route& route, std::string& error) {
  return ReadString(value, "destination_cidr_block", route.destination_cidr_block, error) &&
         ReadString(value, "gateway_id", route.gateway_id, error) &&
         ReadString(value, "nat_gateway_id", route.nat_gateway_id, error) &&
         ReadString(value, "state", route.state, error) &&
         ReadString(value, "origin", route.origin, error);
}

bool ParseRouteTable(const JsonValue& value, RouteTable& table, std::string& error) {
  return ReadString(value, "route_table_id", table.route_table_id, error) &&
         ReadString(value, "vpc_id", table.vpc_id, error) &&
         ReadArray(value, "associations", table.associations, ParseAssociation, error) &&
         ReadArray(value, "routes", table.routes, ParseRoute, error) &&
         ReadTags(value, table.tags, error);
}

bool ParseSecurityGroup(const JsonValue& value, SecurityGroup& group, std::string& error) {
  return ReadString(value, "group_id", group.group_id, error) &&
         ReadString(value, "group_name", group.group_name, error) &&
         ReadString(value, "description", group.description, error) &&
         ReadString(value, "vpc_id", group.vpc_id, error) &&
         ReadArray(value, "ingress", group.ingress, ParsePermission, error) &&
         ReadTags(value, group.tags, error);
}

bool ParseInstance(const JsonValue& value, Instance& instance, std::string& error) {
  std::string state_text;
  if (!ReadString(value, "instance_id", instance.instance_id, error) ||
      !ReadString(value, "reservation_id", instance.reservation_id, error) ||
      !ReadString(value, "launch_time", instance.launch_time, error) ||
      !ReadString(value, "image_id", instance.image_id, error) ||
      !ReadString(value, "instance_type", instance.instance_type, error) ||
      !ReadString(value, "key_name", instance.key_name, error) ||
      !ReadString(value, "vpc_id", instance.vpc_id, error) ||
      !ReadString(value, "subnet_id", instance.subnet_id, error) ||
      !ReadString(value, "private_ip", instance.private_ip, error) ||
      !ReadString(value, "public_ip", instance.public_ip, error) ||
      !ReadStringArray(value, "security_group_ids", instance.security_group_ids, error) ||
      !ReadString(value, "state", state_text, error) || !ReadTags(value, instance.tags, error)) {
    return false;
  }
  if (!ParseInstanceState(state_text, instance.state)) {
    error = "unsupported instance state '" + state_text + "'";
    return false;
  }
  return true;
}

bool ParseNetworkInterface(const JsonValue& value, NetworkInterface& eni, std::string& error) {
  if (!ReadString(value, "network_interface_id", eni.network_interface_id, error) ||
      !ReadString(value, "vpc_id", eni.vpc_id, error) ||
      !ReadString(value, "subnet_id", eni.subnet_id, error) ||
      !ReadString(value, "interface_type", eni.interface_type, error) ||
      !ReadString(value, "status", eni.status, error) ||
      !ReadString(value, "private_ip", eni.private_ip, error) ||
      !ReadString(value, "description", eni.description, error)) {
    return false;
  }

  eni.attachment.reset();
  const JsonValue* attachment = value.Find("attachment");
  if (attachment != nullptr && attachment->IsObject()) {
    NetworkInterfaceAttachment parsed;
    if (!ReadString(*attachment, "attachment_id", parsed.attachment_id, error) ||
        !ReadString(*attachment, "instance_id", parsed.instance_id, error) ||
        !ReadString(*attachment, "status", parsed.status, error)) {
      error = "attachment: " + error;
      return false;
    }
    eni.attachment = std::move(parsed);
  }

  eni.association.reset();
  const JsonValue* association = value.Find("association");
  if (association != nullptr && association->IsObject()) {
    NetworkInterfaceAssociation parsed;
    if (!ReadString(*association, "public_ip", parsed.public_ip, error) ||
        !ReadString(*association, "association_id", parsed.association_id, error) ||
        !ReadString(*association, "allocation_id", parsed.allocation_id, error)) {
      error = "association: " + error;
      return false;
    }
    eni.association = std::move(parsed);
  }
  return true;
}

} // namespace

std::string SimStateToJson(const SimCloudState& state) {
  JsonWriter out(2);
  out.BeginObject();
  out.StringField("schema_version", kSchemaVersion);
  out.UIntField("next_id", state.next_id);

  out.Key("vpcs").BeginArray();
  for (const auto& [id, vpc] : state.vpcs) {
    out.BeginObject()
        .StringField("vpc_id", vpc.vpc_id)
        .StringField("cidr_block", vpc.cidr_block)
        .StringField("state", vpc.state)
        .BoolField("is_default", vpc.is_default);
    WriteTags(out, vpc.tags);
    out.EndObject();
  }
  out.EndArray();

  out.Key("subnets").BeginArray();
  for (const auto& [id, subnet] : state.subnets) {
    out.BeginObject()
        .StringField("subnet_id", subnet.subnet_id)
        .StringField("vpc_id", subnet.vpc_id)
        .StringField("cidr_block", subnet.cidr_block)
        .StringField("availability_zone", subnet.availability_zone)
        .StringField("state", subnet.state)
        .BoolField("map_public_ip_on_launch", subnet.map_public_ip_on_launch);
    WriteTags(out, subnet.tags);
    out.EndObject();
  }
  out.EndArray();

  out.Key("internet_gateways").BeginArray();
  for (const auto& [id, gateway] : state.internet_gateways) {
    out.BeginObject().StringField("internet_gateway_id", gateway.internet_gateway_id);
    out.Key("attachments").BeginArray();
    for (const auto& attachment : gateway.attachments) {
      out.BeginObject()
          .StringField("vpc_id", attachment.vpc_id)
          .StringField("state", attachment.state)
          .EndObject();
    }
    out.EndArray();
    WriteTags(out, gateway.tags);
    out.EndObject();
  }
  out.EndArray();

  out.Key("addresses").BeginArray();
  for (const auto& [id, address] : state.addresses) {
    out.BeginObject()
        .StringField("allocation_id", address.allocation_id)
        .StringField("public_ip", address.public_ip)
        .StringField("association_id", address.association_id)
        .StringField("network_interface_id", address.network_interface_id)
        .EndObject();
  }
  out.EndArray();

  out.Key("nat_gateways").BeginArray();
  for (const auto& [id, gateway] : state.nat_gateways) {
    out.BeginObject()
        .StringField("nat_gateway_id", gateway.nat_gateway_id)
        .StringField("vpc_id", gateway.vpc_id)
        .StringField("subnet_id", gateway.subnet_id)
        .StringField("state", ToString(gateway.state));
    out.Key("addresses").BeginArray();
    for (const auto& address : gateway.addresses) {
      out.BeginObject()
          .StringField("allocation_id", address.allocation_id)
          .StringField("network_interface_id", address.network_interface_id)
          .StringField("public_ip", address.public_ip)
          .StringField("private_ip", address.private_ip)
          .EndObject();
    }
    out.EndArray();
    WriteTags(out, gateway.tags);
    out.EndObject();
  }
  out.EndArray();

  out.Key("route_tables").BeginArray();
  for (const auto& [id, table] : state.route_tables) {
    out.BeginObject()
        .StringField("route_table_id", table.route_table_id)
        .StringField("vpc_id", table.vpc_id);
    out.Key("associations").BeginArray();
    for (const auto& association : table.associations) {
      out.BeginObject()
          .StringField("association_id", association.association_id)
          .StringField("route_table_id", association.route_table_id)
          .StringField("subnet_id", association.subnet_id)
          .BoolField("main", association.main)
          .EndObject();
    }
    out.EndArray();
    out.Key("routes").BeginArray();
    for (const auto& route : table.routes) {
      out.BeginObject()
          .StringField("destination_cidr_block", route.destination_cidr_block)
          .StringField("gateway_id", route.gateway_id)
          .StringField("nat_gateway_id", route.nat_gateway_id)
          .StringField("state", route.state)
          .StringField("origin", route.origin)
          .EndObject();
    }
    out.EndArray();
    WriteTags(out, table.tags);
    out.EndObject();
  }
  out.EndArray();

  out.Key("security_groups").BeginArray();
  for (const auto& [id, group] : state.security_groups) {
    out.BeginObject()
        .StringField("group_id", group.group_id)
        .StringField("group_name", group.group_name)
        .StringField("description", group.description)
        .StringField("vpc_id", group.vpc_id);
    out.Key("ingress").BeginArray();
    for (const auto& permission : group.ingress) {
      WritePermission(out, permission);
    }
    out.EndArray();
    WriteTags(out, group.tags);
    out.EndObject();
  }
  out.EndArray();

  out.Key("instances").BeginArray();
  for (const auto& [id, instance] : state.instances) {
    out.BeginObject()
        .StringField("instance_id", instance.instance_id)
        .StringField("reservation_id", instance.reservation_id)
        .StringField("launch_time", instance.launch_time)
        .StringField("image_id", instance.image_id)
        .StringField("instance_type", instance.instance_type)
        .StringField("key_name", instance.key_name)
        .StringField("vpc_id", instance.vpc_id)
        .StringField("subnet_id", instance.subnet_id)
        .StringField("private_ip", instance.private_ip)
        .StringField("public_ip", instance.public_ip)
        .StringArrayField("security_group_ids", instance.security_group_ids)
        .StringField("state", ToString(instance.state));
    WriteTags(out, instance.tags);
    out.EndObject();
  }
  out.EndArray();

  out.Key("network_interfaces").BeginArray();
  for (const auto& [id, eni] : state.network_interfaces) {
    out.BeginObject()
        .StringField("network_interface_id", eni.network_interface_id)
        .StringField("vpc_id", eni.vpc_id)
        .StringField("subnet_id", eni.subnet_id)
        .StringField("interface_type", eni.interface_type)
        .StringField("status", eni.status)
        .StringField("private_ip", eni.private_ip)
        .StringField("description", eni.description);
    out.Key("attachment");
    if (eni.attachment.has_value()) {
      out.BeginObject()
          .StringField("attachment_id", eni.attachment->attachment_id)
          .StringField("instance_id", eni.attachment->instance_id)
          .StringField("status", eni.attachment->status)
          .EndObject();
    } else {
      out.Null();
    }
    out.Key("association");
    if (eni.association.has_value()) {
      out.BeginObject()
          .StringField("public_ip", eni.association->public_ip)
          .StringField("association_id", eni.association->association_id)
          .StringField("allocation_id", eni.association->allocation_id)
          .EndObject();
    } else {
      out.Null();
    }
    out.EndObject();
  }
  out.EndArray();

  WriteCounters(out, "transition_polls", state.transition_polls);
  WriteCounters(out, "tag_lag", state.tag_lag);
  out.EndObject();
  return out.str() + "\n";
}

bool WriteSimState(const SimCloudState& state, const fs::path& output_path, std::string& error) {
  error.clear();
  if (!core::WriteTextFileAtomic(output_path, SimStateToJson(state), error)) {
    error = "failed while writing sim state '" + output_path.string() + "' (" + error + ")";
    return false;
  }
  return true;
}

bool LoadSimState(const fs::path& input_path, SimCloudState& state, std::string& error) {
  state = SimCloudState{};

  std::error_code ec;
  if (!fs::exists(input_path, ec)) {
    return true;
  }

  std::string text;
  if (!core::ReadTextFile(input_path, text, error)) {
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid sim state JSON '" + input_path.string() + "': " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "sim state root must be a JSON object";
    return false;
  }

  std::string schema_version;
  if (!ReadString(root, "schema_version", schema_version, error)) {
    error = "sim state parse failed for '" + input_path.string() + "': " + error;
    return false;
  }
  if (schema_version != kSchemaVersion) {
    error = "sim state '" + input_path.string() + "' has unsupported schema_version '" +
            schema_version + "'";
    return false;
  }

  SimCloudState loaded;
  const bool ok =
      ReadUnsigned(root, "next_id", loaded.next_id, error) &&
      ReadRecordMap(root, "vpcs", loaded.vpcs, ParseVpc,
                    [](const Vpc& vpc) { return vpc.vpc_id; }, error) &&
      ReadRecordMap(root, "subnets", loaded.subnets, ParseSubnet,
                    [](const Subnet& subnet) { return subnet.subnet_id; }, error) &&
      ReadRecordMap(
          root, "internet_gateways", loaded.internet_gateways, ParseInternetGateway,
          [](const InternetGateway& gateway) { return gateway.internet_gateway_id; }, error) &&
      ReadRecordMap(root, "addresses", loaded.addresses, ParseAddress,
                    [](const Address& address) { return address.allocation_id; }, error) &&
      ReadRecordMap(root, "nat_gateways", loaded.nat_gateways, ParseNatGateway,
                    [](const NatGateway& gateway) { return gateway.nat_gateway_id; }, error) &&
      ReadRecordMap(root, "route_tables", loaded.route_tables, ParseRouteTable,
                    [](const RouteTable& table) { return table.route_table_id; }, error) &&
      ReadRecordMap(root, "security_groups", loaded.security_groups, ParseSecurityGroup,
                    [](const SecurityGroup& group) { return group.group_id; }, error) &&
      ReadRecordMap(root, "instances", loaded.instances, ParseInstance,
                    [](const Instance& instance) { return instance.instance_id; }, error) &&
      ReadRecordMap(
          root, "network_interfaces", loaded.network_interfaces, ParseNetworkInterface,
          [](const NetworkInterface& eni) { return eni.network_interface_id; }, error) &&
      ReadCounters(root, "transition_polls", loaded.transition_polls, error) &&
      ReadCounters(root, "tag_lag", loaded.tag_lag, error);
  if (!ok) {
    error = "sim state parse failed for '" + input_path.string() + "': " + error;
    return false;
  }

  state = std::move(loaded);
  return true;
}

} // namespace netstack::cloud::sim
