/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "strata/Node.h"

#include <gtest/gtest.h>
#include <memory>

using namespace strata;
using namespace std;


static vector<string>
keysOf (const NodeList & list)
{
    vector<string> result;
    for (Node * n : list) result.push_back (n->key ());
    return result;
}

static vector<string>
valuesOf (const NodeList & list)
{
    vector<string> result;
    for (Node * n : list) result.push_back (n->value ().toString ());
    return result;
}


TEST (ResolveTest, WildcardFollowsCreationOrder)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("1",  "main.string.one");
    root->set (1,    "main.1.one");
    root->set (true, "main.bool.one");
    root->set (2,    "main.bool.two");

    vector<string> expected {"1", "1", "true"};
    EXPECT_EQ (expected, valuesOf (root->getNodes ("main.*.one")));
    EXPECT_EQ (expected, valuesOf (root->getNode ("main").getNodes ("*", "one")));
    EXPECT_EQ (expected, root->getStringValues ("main", "*", "one"));

    vector<string> all {"string", "1", "bool"};
    EXPECT_EQ (all, keysOf (root->getNodes ("main.*")));
    EXPECT_EQ (4u, root->getNodes ("*.*.*").size ());
    EXPECT_TRUE (root->getNodes ("main.*.three").empty ());
}

TEST (ResolveTest, LiteralStarChildIsFallback)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set (1, "server.app");
    root->set (2, "server.*");
    root->set (3, "server.db");

    vector<string> both {"1", "2"};
    EXPECT_EQ (both, valuesOf (root->getNodes ("server.app")));
    EXPECT_EQ (1, root->getInt ("server.app"));
    EXPECT_EQ (2, root->getInt ("server.other"));

    // A query wildcard matches the "*" child like any other.
    vector<string> all {"1", "2", "3"};
    EXPECT_EQ (all, valuesOf (root->getNodes ("server.*")));
}

TEST (ResolveTest, LiteralStarInMiddleOfPath)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("star",  "params.2023.*.value");
    root->set ("exact", "params.2023.s.value");

    EXPECT_EQ ("exact", root->getString ("params.2023.s.value"));
    EXPECT_EQ ("star",  root->getString ("params.2023.whatever.value"));
    EXPECT_EQ ("star",  root->getString ("params", 2023, "", "value"));
    EXPECT_EQ (&Node::none, &root->getNode ("params.2024.s.value"));
}

TEST (ResolveTest, Limit)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("a", "main.a");
    root->set ("b", "main.b");
    root->set ("c", "main.c");

    vector<string> two {"a", "b"};
    EXPECT_EQ (two, keysOf (root->resolve ({"main", "*"}, 2)));
    EXPECT_EQ (3u, root->resolve ({"main", "*"}, 0).size ());
    EXPECT_EQ (3u, root->resolve ({"main", "*"}, 10).size ());
    EXPECT_EQ ("a", root->find ({"main", "*"}).key ());
}

TEST (ResolveTest, EmptyPathAndNone)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set (1, "a");

    NodeList self = root->getNodes ();
    ASSERT_EQ (1u, self.size ());
    EXPECT_EQ (root.get (), self[0]);
    EXPECT_EQ (root.get (), &root->getNode ());

    EXPECT_TRUE (Node::none.getNodes ("a").empty ());
    EXPECT_TRUE (Node::none.getNodes ().empty ());
    EXPECT_EQ (&Node::none, &root->getNode ("b"));
    EXPECT_EQ (&Node::none, &root->getNode ("a.b"));
}

TEST (ResolveTest, Deterministic)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set (1, "x.b.v");
    root->set (2, "x.a.v");
    root->set (3, "x.*.v");
    unique_ptr<Node> scope (root->with ({{"x.c.v", Value (4)}}));

    vector<string> first = valuesOf (scope->getNodes ("x.*.v"));
    for (int i = 0; i < 5; i++) EXPECT_EQ (first, valuesOf (scope->getNodes ("x.*.v")));
    vector<string> expected {"4", "1", "2", "3"};
    EXPECT_EQ (expected, first);
}

TEST (ResolveTest, ScopeInheritance)
{
    unique_ptr<Node> a (Node::newRoot ());
    a->set ("1", "main.string.one");

    unique_ptr<Node> b (a->with ());
    b->set ("3", "main.string.three");
    EXPECT_EQ ("1", b->getString ("main.string.one"));
    EXPECT_EQ ("3", b->getString ("main.string.three"));
    EXPECT_EQ (&Node::none, &a->getNode ("main.string.three"));
    EXPECT_EQ (a.get (), &b->scopeParent ());
    EXPECT_EQ (&Node::none, &a->scopeParent ());

    // Shadowing
    b->set ("override", "main.string.one");
    EXPECT_EQ ("override", b->getString ("main.string.one"));
    EXPECT_EQ ("1",        a->getString ("main.string.one"));

    // Nearer scopes come first.
    unique_ptr<Node> c (b->with ({{"main.int.five", Value (5)}}));
    vector<string> expected {"5", "3", "override", "1"};
    EXPECT_EQ (expected, c->getStringValues ("main.*.*"));

    // Later changes to an ancestor are visible.
    a->set ("2", "main.string.two");
    EXPECT_EQ ("2", c->getString ("main.string.two"));
}

TEST (ResolveTest, UnsetRevealsAncestor)
{
    unique_ptr<Node> a (Node::newRoot ());
    a->set ("old", "x.y");
    unique_ptr<Node> b (a->with ());
    b->set ("new", "x.y");
    EXPECT_EQ ("new", b->getString ("x.y"));

    delete b->unset ("x.y");
    EXPECT_EQ ("old", b->getString ("x.y"));
}

TEST (ResolveTest, InteriorNodeReanchors)
{
    unique_ptr<Node> a (Node::newRoot ());
    a->set ("db.example.com", "cfg.db.host");
    a->set (5432,             "cfg.db.port");

    unique_ptr<Node> b (a->with ());
    b->set (6543, "cfg.db.port");

    Node & db = b->getNode ("cfg.db");
    EXPECT_EQ (b.get (), &db.root ());
    EXPECT_EQ (6543,             db.getInt ("port"));
    EXPECT_EQ ("db.example.com", db.getString ("host"));

    vector<string> ports {"6543", "5432"};
    EXPECT_EQ (ports, db.getStringValues ("port"));
}

TEST (ResolveTest, ScopeFromInteriorNode)
{
    unique_ptr<Node> a (Node::newRoot ());
    a->set ("db.example.com", "cfg.db.host");

    Node & cfg = a->getNode ("cfg");
    unique_ptr<Node> s (cfg.with ({{"db.user", Value ("admin")}}));
    EXPECT_EQ ("admin",          s->getString ("cfg.db.user"));
    EXPECT_EQ ("db.example.com", s->getString ("cfg.db.host"));
    EXPECT_EQ (&Node::none, &a->getNode ("cfg.db.user"));
}

TEST (ResolveTest, LimitSpansScopes)
{
    unique_ptr<Node> a (Node::newRoot ());
    a->set (1, "list.a");
    a->set (2, "list.b");
    unique_ptr<Node> b (a->with ({{"list.c", Value (3)}}));

    vector<string> two {"c", "a"};
    EXPECT_EQ (two, keysOf (b->resolve ({"list", "*"}, 2)));
    EXPECT_EQ (3, b->getInt ("list.*"));
}
