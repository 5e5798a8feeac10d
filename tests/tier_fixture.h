#pragma once

// Shared taxonomy with a three-level tier layout:
//   BOOLEAN -> development -> {boolean}                   (direct at both tiers)
//   DATE    -> date        -> {eu_slash, iso, us_slash}   (direct tier 1, delegated tier 2)
//   VARCHAR -> internet    -> {ip_v4, url}                (delegated at both tiers)
//   VARCHAR -> person      -> {email}                     (delegated tier 1, direct tier 2)
inline const char* kTieredTaxonomyYaml = R"(
technology.development.boolean:
  tier: [BOOLEAN, development]
datetime.date.iso:
  tier: [DATE, date]
datetime.date.us_slash:
  tier: [DATE, date]
datetime.date.eu_slash:
  tier: [DATE, date]
technology.internet.ip_v4:
  tier: [VARCHAR, internet]
technology.internet.url:
  tier: [VARCHAR, internet]
identity.person.email:
  tier: [VARCHAR, person]
representation.text.word:
  title: "No tier path"
)";
