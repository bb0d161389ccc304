#include <gtest/gtest.h>
#include <string>
#include "bactopo/core/graph_builder.hpp"
#include "bactopo/core/graph_diff.hpp"
#include "bactopo/core/turtle.hpp"
#include "test_utils.hpp"

using namespace bactopo::core;
using namespace bactopo::core::test;

namespace {

NetworkGraph make_site_graph(const char* name = "site.ttl") {
  auto facts = make_site_facts();
  facts.emplace_back(DistributorFact(ip("192.168.1.20"), {ip("192.168.1.20")}));
  return build_graph(facts, BuildOptions{name, "2024-03-01T12:00:00Z"});
}

} // namespace

TEST(Turtle, SnapshotRoundTrip) {
  auto g = make_site_graph();
  auto text = write_turtle(g);
  auto back = read_turtle(text);
  EXPECT_TRUE(back == g);
  EXPECT_EQ(back.name(), "site.ttl");
  EXPECT_EQ(back.timestamp(), "2024-03-01T12:00:00Z");
}

TEST(Turtle, WriterIsDeterministic) {
  EXPECT_EQ(write_turtle(make_site_graph()), write_turtle(make_site_graph()));
}

TEST(Turtle, WriterUsesBacnetVocabulary) {
  auto text = write_turtle(make_device_network_graph(true));
  EXPECT_NE(text.find("@prefix bacnet: <http://data.ashrae.org/bacnet/2020#> ."), std::string::npos);
  EXPECT_NE(text.find("<d1> a bacnet:Device"), std::string::npos);
  EXPECT_NE(text.find("bacnet:device-on-network <n1>"), std::string::npos);
  EXPECT_NE(text.find("<urn:bactopo:snapshot> a bacnet:Snapshot"), std::string::npos);
}

TEST(Turtle, NameOverride) {
  auto g = read_turtle(write_turtle(make_site_graph()), "renamed.ttl");
  EXPECT_EQ(g.name(), "renamed.ttl");
}

TEST(Turtle, ReadsHandWrittenForms) {
  const std::string text = R"(# a hand-edited snapshot
PREFIX bacnet: <http://data.ashrae.org/bacnet/2020#>
@prefix rdfs: <http://www.w3.org/2000/01/rdf-schema#> .
@prefix ex: <http://example.org/> .

<bacnet://1> a bacnet:Device ;
    rdfs:label "Boiler \"A\"" ;
    bacnet:vendor-id 42 ;
    bacnet:bdt-enabled false ;
    ex:note 'kept' ;
    bacnet:device-on-network <bacnet://network/5> ;
    .
<bacnet://2> a bacnet:Device ; rdfs:label """Chiller
two""" ; bacnet:device-on-network <bacnet://network/5>, <bacnet://network/9> .
<bacnet://network/5> a bacnet:Network .
<bacnet://untyped> rdfs:label "ignored" .
)";
  auto g = read_turtle(text, "hand.ttl");
  ASSERT_EQ(g.num_entities(), 3);
  const auto* d1 = g.find("bacnet://1");
  ASSERT_NE(d1, nullptr);
  EXPECT_EQ(d1->label, "Boiler \"A\"");
  EXPECT_EQ(std::get<std::int64_t>(d1->attributes.at("vendor-id")), 42);
  EXPECT_FALSE(std::get<bool>(d1->attributes.at("bdt-enabled")));
  EXPECT_EQ(std::get<std::string>(d1->attributes.at("http://example.org/note")), "kept");
  EXPECT_EQ(g.find("bacnet://2")->label, "Chiller\ntwo");
  // The edge to the undeclared network 9 is dropped; the other two remain.
  EXPECT_EQ(g.num_edges(), 2);
  EXPECT_FALSE(g.contains("bacnet://untyped"));
}

TEST(Turtle, ForeignPredicatesSurviveRoundTrip) {
  const std::string text =
      "@prefix bacnet: <http://data.ashrae.org/bacnet/2020#> .\n"
      "<bacnet://1> a bacnet:Device, <http://example.org/Thing> ;\n"
      "  <http://example.org/note> \"x\" .\n";
  auto g = read_turtle(text);
  auto again = read_turtle(write_turtle(g));
  EXPECT_TRUE(again == g);
  EXPECT_EQ(std::get<std::string>(g.find("bacnet://1")->attributes.at("rdf-type")), "http://example.org/Thing");
}

TEST(Turtle, ParseErrorReportsLine) {
  const std::string text =
      "@prefix bacnet: <http://data.ashrae.org/bacnet/2020#> .\n"
      "<bacnet://1> a bacnet:Device ;\n"
      "    bacnet:vendor-id 5 5 .\n";
  try {
    (void)read_turtle(text);
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.line(), 3u);
  }
}

TEST(Turtle, MalformedDocumentsThrow) {
  EXPECT_THROW((void)read_turtle("<bacnet://1> a nope:Device ."), ParseError);
  EXPECT_THROW((void)read_turtle("<bacnet://1> <p> \"unterminated ."), ParseError);
  EXPECT_THROW((void)read_turtle("<bacnet://1 a <x> ."), ParseError);
  EXPECT_THROW((void)read_turtle("@prefix bacnet: <http://data.ashrae.org/bacnet/2020#> .\n"
                                 "<bacnet://1> a bacnet:Device .\n<bacnet://1> a bacnet:Router ."),
               ParseError);
}

TEST(Turtle, EmptyDocumentIsEmptyGraph) {
  auto g = read_turtle("# nothing here\n");
  EXPECT_TRUE(g.empty());
}

TEST(Turtle, DiffRoundTrip) {
  auto a = make_device_network_graph(true, "a.ttl");
  auto b = NetworkGraph::from_parts("b.ttl", "", {
      make_entity("d1", EntityKind::Device, "Device 1"),
      make_entity("n1", EntityKind::Network, "Network 1"),
      make_entity("d3", EntityKind::Device, "Device 3"),
  }, {
      Edge{EdgeKind::DeviceOnNetwork, "d1", "n1"},
      Edge{EdgeKind::DeviceOnNetwork, "d3", "n1"},
  });
  auto d = diff(a, b, DiffOptions{"a.ttl", "b.ttl", "", ""});
  auto text = write_turtle(d);
  EXPECT_NE(text.find("bacnet:rdf_diff_source \"b.ttl\""), std::string::npos);
  EXPECT_NE(text.find("rdf:subject <d2>"), std::string::npos);

  auto back = read_diff_turtle(text);
  EXPECT_EQ(back.source_a(), "a.ttl");
  EXPECT_EQ(back.source_b(), "b.ttl");
  EXPECT_TRUE(back.graph() == d.graph());
  EXPECT_EQ(back.provenance("d2"), Provenance::Removed);
  EXPECT_EQ(back.provenance("d3"), Provenance::Added);
  EXPECT_EQ(back.provenance("d1"), Provenance::Unchanged);
  EXPECT_EQ(back.provenance(Edge{EdgeKind::DeviceOnNetwork, "d2", "n1"}), Provenance::Removed);
  EXPECT_EQ(back.provenance(Edge{EdgeKind::DeviceOnNetwork, "d3", "n1"}), Provenance::Added);
  EXPECT_EQ(back.provenance(Edge{EdgeKind::DeviceOnNetwork, "d1", "n1"}), Provenance::Unchanged);
}

TEST(Turtle, DiffReaderNeedsSources) {
  EXPECT_THROW((void)read_diff_turtle(write_turtle(make_device_network_graph(false))), ParseError);
}

TEST(Turtle, DiffReaderRejectsUnknownSource) {
  auto d = diff(make_device_network_graph(false), make_device_network_graph(true),
                DiffOptions{"a.ttl", "b.ttl", "", ""});
  auto text = write_turtle(d);
  auto pos = text.find("rdf_diff_source \"b.ttl\"");
  ASSERT_NE(pos, std::string::npos);
  text.replace(pos, std::string("rdf_diff_source \"b.ttl\"").size(), "rdf_diff_source \"c.ttl\"");
  EXPECT_THROW((void)read_diff_turtle(text), ParseError);
}

TEST(Turtle, DiffRoundTripWithSharedSourceName) {
  // Default options leave both sources empty.
  auto added = diff(make_device_network_graph(false), make_device_network_graph(true));
  auto text = write_turtle(added);
  EXPECT_NE(text.find("bacnet:diff-provenance \"added\""), std::string::npos);
  auto back = read_diff_turtle(text);
  EXPECT_TRUE(back.graph() == added.graph());
  EXPECT_EQ(back.provenance("d2"), Provenance::Added);
  EXPECT_EQ(back.provenance(Edge{EdgeKind::DeviceOnNetwork, "d2", "n1"}), Provenance::Added);
  EXPECT_EQ(back.provenance("d1"), Provenance::Unchanged);

  auto removed = diff(make_device_network_graph(true), make_device_network_graph(false),
                      DiffOptions{"x", "x", "", ""});
  auto again = read_diff_turtle(write_turtle(removed));
  EXPECT_EQ(again.provenance("d2"), Provenance::Removed);
  EXPECT_EQ(again.provenance(Edge{EdgeKind::DeviceOnNetwork, "d2", "n1"}), Provenance::Removed);
}

namespace {

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
  for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
    text.replace(pos, from.size(), to);
  }
  return text;
}

} // namespace

TEST(Turtle, DiffReaderNeedsProvenanceWhenSourcesMatch) {
  auto d = diff(make_device_network_graph(false), make_device_network_graph(true),
                DiffOptions{"x", "x", "", ""});
  auto text = replace_all(write_turtle(d), "bacnet:diff-provenance \"added\"", "rdfs:comment \"edited\"");
  EXPECT_THROW((void)read_diff_turtle(text), ParseError);
}

TEST(Turtle, DiffReaderChecksProvenanceLiteral) {
  auto d = diff(make_device_network_graph(false), make_device_network_graph(true),
                DiffOptions{"a.ttl", "b.ttl", "", ""});
  const auto text = write_turtle(d);
  // Without the literal, distinct sources still decide.
  auto by_source = read_diff_turtle(
      replace_all(text, "bacnet:diff-provenance \"added\"", "rdfs:comment \"edited\""));
  EXPECT_EQ(by_source.provenance("d2"), Provenance::Added);

  EXPECT_THROW((void)read_diff_turtle(
                   replace_all(text, "diff-provenance \"added\"", "diff-provenance \"removed\"")),
               ParseError);
  EXPECT_THROW((void)read_diff_turtle(
                   replace_all(text, "diff-provenance \"added\"", "diff-provenance \"moved\"")),
               ParseError);
}
