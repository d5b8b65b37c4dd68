#include "ReactReconciler/ReactFiberHydrationContext.h"

#include "ReactDOM/client/ReactDOMComponent.h"
#include "ReactDOM/client/ReactDOMDiffProperties.h"

#include <cstddef>
#include <memory>
#include <string>

namespace reactdom {
namespace {

std::shared_ptr<ReactDOMComponent> asComponent(const hostconfig::HostInstance& instance) {
  return std::dynamic_pointer_cast<ReactDOMComponent>(instance);
}

std::string describeNode(const std::shared_ptr<ReactDOMComponent>& node) {
  if (!node) {
    return "null";
  }
  if (node->isTextInstance()) {
    return "text node";
  }
  return "<" + node->getType() + ">";
}

std::string joinNames(const std::vector<std::string>& names) {
  std::string joined;
  for (std::size_t index = 0; index < names.size(); ++index) {
    if (index > 0) {
      joined += ", ";
    }
    joined += names[index];
  }
  return joined;
}

void matchProperties(
    const ReactDOMComponent& server,
    const ReactDOMComponent& client,
    HydrationResult& result) {
  const Props& serverProps = server.getProps();
  const Props& clientProps = client.getProps();
  const PropertyDiff diff = diffHostProperties(serverProps, clientProps);
  if (diff.empty()) {
    return;
  }

  result.matched = false;
  if (!diff.removed.empty()) {
    result.mismatches.push_back("Extra attributes from the server: " + joinNames(diff.removed));
  }
  for (const auto& name : diff.added) {
    result.mismatches.push_back(
      "Prop `" + name + "` did not match. Server: null Client: \"" +
      propValueToString(clientProps.at(name)) + "\"");
  }
  for (const auto& name : diff.changed) {
    result.mismatches.push_back(
      "Prop `" + name + "` did not match. Server: \"" + propValueToString(serverProps.at(name)) +
      "\" Client: \"" + propValueToString(clientProps.at(name)) + "\"");
  }
}

bool matchNodes(
    const std::vector<hostconfig::HostInstance>& existing,
    const std::vector<hostconfig::HostInstance>& rendered,
    const std::string& parentType,
    HydrationResult& result) {
  const std::size_t length = existing.size() < rendered.size() ? existing.size() : rendered.size();

  for (std::size_t index = 0; index < length; ++index) {
    auto server = asComponent(existing[index]);
    auto client = asComponent(rendered[index]);
    if (!server || !client) {
      result.matched = false;
      result.mismatches.push_back("Cannot hydrate a non-component host node in <" + parentType + ">.");
      return false;
    }

    if (client->isTextInstance() || server->isTextInstance()) {
      if (client->isTextInstance() != server->isTextInstance()) {
        result.matched = false;
        result.mismatches.push_back(
          "Expected server HTML to contain a matching " + describeNode(client) + " in <" + parentType + ">.");
        return false;
      }
      if (server->getTextContent() != client->getTextContent()) {
        result.matched = false;
        result.mismatches.push_back(
          "Text content did not match. Server: \"" + server->getTextContent() + "\" Client: \"" +
          client->getTextContent() + "\"");
      }
      continue;
    }

    if (server->getType() != client->getType()) {
      result.matched = false;
      result.mismatches.push_back(
        "Expected server HTML to contain a matching " + describeNode(client) + " in <" + parentType + ">.");
      return false;
    }

    matchProperties(*server, *client, result);
    if (!matchNodes(server->children, client->children, client->getType(), result)) {
      return false;
    }
  }

  if (existing.size() > rendered.size()) {
    result.matched = false;
    result.mismatches.push_back(
      "Did not expect server HTML to contain a " + describeNode(asComponent(existing[length])) +
      " in <" + parentType + ">.");
    return false;
  }
  if (rendered.size() > existing.size()) {
    result.matched = false;
    result.mismatches.push_back(
      "Expected server HTML to contain a matching " + describeNode(asComponent(rendered[length])) +
      " in <" + parentType + ">.");
    return false;
  }
  return true;
}

} // namespace

HydrationResult matchHydratableChildren(
    const std::vector<hostconfig::HostInstance>& existing,
    const std::vector<hostconfig::HostInstance>& rendered,
    const std::string& parentType) {
  HydrationResult result;
  matchNodes(existing, rendered, parentType, result);
  return result;
}

} // namespace reactdom
