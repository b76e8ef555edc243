/**
 * @file reference.hpp
 * @author Ruan Formigoni
 * @brief Parses container image references
 *
 * References are normalized the way docker does it:
 * ```
 * busybox                        -> docker.io/library/busybox:latest
 * ghcr.io/org/app@sha256:...     -> host ghcr.io, repo org/app
 * localhost:5000/app:v1          -> host localhost:5000, repo app
 * ```
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "../std/expected.hpp"
#include "../std/string.hpp"
#include "../macro.hpp"

namespace ns_reference
{

inline constexpr std::string_view DOMAIN_DEFAULT = "docker.io";
inline constexpr std::string_view DOMAIN_LEGACY = "index.docker.io";
inline constexpr std::string_view REPO_OFFICIAL = "library";
inline constexpr std::string_view TAG_DEFAULT = "latest";

struct Reference
{
  std::string host;
  std::string repo;
  std::string tag;
  std::string digest;
};

namespace
{

// A path component is [a-z0-9]+ joined by '.', '_', '__' or one or more '-'
inline bool is_path_component(std::string_view component)
{
  auto f_alnum = [](char c){ return std::islower(static_cast<unsigned char>(c)) or std::isdigit(static_cast<unsigned char>(c)); };
  return_if(component.empty(), false);
  return_if(not f_alnum(component.front()) or not f_alnum(component.back()), false);
  for(size_t i = 0; i < component.size(); ++i)
  {
    char c = component[i];
    continue_if(f_alnum(c) or c == '-');
    if(c == '.' or c == '_')
    {
      // '__' is the only repeated separator besides dashes
      bool const is_double_underscore = c == '_' and i + 1 < component.size() and component[i+1] == '_';
      if(is_double_underscore) { ++i; }
      return_if(i + 1 < component.size() and not f_alnum(component[i+1]), false);
      continue;
    }
    return false;
  }
  return true;
}

inline bool is_tag(std::string_view tag)
{
  auto f_word = [](char c){ return std::isalnum(static_cast<unsigned char>(c)) or c == '_'; };
  return not tag.empty()
    and tag.size() <= 128
    and f_word(tag.front())
    and std::ranges::all_of(tag, [&](char c){ return f_word(c) or c == '.' or c == '-'; });
}

inline bool is_digest(std::string_view digest)
{
  auto pos = digest.find(':');
  return_if(pos == std::string_view::npos or pos == 0 or pos + 1 == digest.size(), false);
  std::string_view hex = digest.substr(pos+1);
  return hex.size() >= 32 and std::ranges::all_of(hex, [](char c){ return std::isxdigit(static_cast<unsigned char>(c)); });
}

// The first path component names a registry when it has a dot, a port or is localhost
inline bool is_domain(std::string_view component)
{
  return component.find_first_of(".:") != std::string_view::npos or component == "localhost";
}

// A label is [A-Za-z0-9] optionally followed by [A-Za-z0-9-]* ending in [A-Za-z0-9]
inline bool is_domain_label(std::string_view label)
{
  auto f_alnum = [](char c){ return std::isalnum(static_cast<unsigned char>(c)); };
  return not label.empty()
    and f_alnum(label.front())
    and f_alnum(label.back())
    and std::ranges::all_of(label, [&](char c){ return f_alnum(c) or c == '-'; });
}

// Dot separated labels with an optional numeric port
inline bool is_valid_domain(std::string_view domain)
{
  if(auto pos = domain.find(':'); pos != std::string_view::npos)
  {
    std::string_view port = domain.substr(pos+1);
    return_if(port.empty() or port.size() > 5, false);
    return_if(not std::ranges::all_of(port, [](char c){ return std::isdigit(static_cast<unsigned char>(c)); }), false);
    domain = domain.substr(0, pos);
  }
  for(auto pos = domain.find('.'); pos != std::string_view::npos; pos = domain.find('.'))
  {
    return_if(not is_domain_label(domain.substr(0, pos)), false);
    domain = domain.substr(pos+1);
  }
  return is_domain_label(domain);
}

} // anonymous namespace

/**
 * @brief Parses an image reference into registry host and repository
 *
 * @param image The image reference
 * @return Value<Reference> The normalized reference or the respective error
 */
[[nodiscard]] inline Value<Reference> parse(std::string_view image)
{
  std::string str_image = ns_string::trim(image);
  return_if(str_image.empty(), Error("D::Empty image reference"));
  Reference reference;
  // Digest
  std::string_view name = str_image;
  if(auto pos = name.find('@'); pos != std::string_view::npos)
  {
    reference.digest = std::string{name.substr(pos+1)};
    return_if(not is_digest(reference.digest), Error("D::Invalid digest '{}' in '{}'", reference.digest, str_image));
    name = name.substr(0, pos);
  }
  // Tag, a colon after the last slash
  auto pos_slash = name.rfind('/');
  auto pos_colon = name.rfind(':');
  if(pos_colon != std::string_view::npos and (pos_slash == std::string_view::npos or pos_colon > pos_slash))
  {
    reference.tag = std::string{name.substr(pos_colon+1)};
    return_if(not is_tag(reference.tag), Error("D::Invalid tag '{}' in '{}'", reference.tag, str_image));
    name = name.substr(0, pos_colon);
  }
  else if(reference.digest.empty())
  {
    reference.tag = TAG_DEFAULT;
  }
  // Domain
  auto pos_first_slash = name.find('/');
  if(pos_first_slash != std::string_view::npos and is_domain(name.substr(0, pos_first_slash)))
  {
    reference.host = std::string{name.substr(0, pos_first_slash)};
    return_if(not is_valid_domain(reference.host)
      , Error("D::Invalid registry host '{}' in '{}'", reference.host, str_image)
    );
    reference.repo = std::string{name.substr(pos_first_slash+1)};
  }
  else
  {
    reference.host = DOMAIN_DEFAULT;
    reference.repo = std::string{name};
  }
  return_if(reference.host.empty(), Error("D::Empty registry host in '{}'", str_image));
  if(reference.host == DOMAIN_LEGACY)
  {
    reference.host = DOMAIN_DEFAULT;
  }
  // Official images
  if(reference.host == DOMAIN_DEFAULT and reference.repo.find('/') == std::string::npos)
  {
    reference.repo = std::format("{}/{}", REPO_OFFICIAL, reference.repo);
  }
  // Repository
  return_if(reference.repo.empty(), Error("D::Empty repository in '{}'", str_image));
  return_if(reference.repo != ns_string::to_lower(reference.repo)
    , Error("D::Repository name must be lowercase in '{}'", str_image)
  );
  for(auto&& component : ns_string::split(reference.repo, '/'))
  {
    return_if(not is_path_component(component)
      , Error("D::Invalid repository component '{}' in '{}'", component, str_image)
    );
  }
  return reference;
}

} // namespace ns_reference

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
