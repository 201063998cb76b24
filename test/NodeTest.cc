/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "strata/Node.h"

#include <gtest/gtest.h>
#include <memory>
#include <sstream>

using namespace strata;
using namespace std;


TEST (NodeTest, SetBuildsPath)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("one",   "main.1");
    root->set ("two",   "main", 2);
    root->set ("three", "main", "3");
    EXPECT_EQ ("{main={1=one,2=two,3=three}}", root->toString ());

    // NONE leaves the old value alone.
    root->set (Value (), "main.1");
    EXPECT_EQ ("one", root->getString ("main.1"));

    root->set ("new", "main.1");
    EXPECT_EQ ("new", root->getString ("main.1"));

    EXPECT_EQ (&Node::none, &root->set ("x", vector<Key> ()));  // empty path
}

TEST (NodeTest, ChangeKey)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("one",   "main.1");
    root->set ("two",   "main.2");
    root->set ("three", "main.3");

    Node & n = root->getNode ("main.2").rename ("two");
    EXPECT_EQ ("two", n.key ());
    EXPECT_EQ ("{main={1=one,3=three,two=two}}", root->toString ());
    EXPECT_EQ (&Node::none, &root->getNode ("main.2"));

    // A rename onto an existing key replaces that sibling.
    root->getNode ("main.1").rename ("3");
    EXPECT_EQ ("{main={two=two,3=one}}", root->toString ());
}

TEST (NodeTest, Depth)
{
    unique_ptr<Node> root (Node::newRoot ());
    EXPECT_EQ (0, root->depth ());
    Node & c = root->addNode ("a.b.c");
    EXPECT_EQ (3, c.depth ());
    EXPECT_EQ (1, root->getNode ("a").depth ());

    unique_ptr<Node> scope (root->with ());
    EXPECT_EQ (0, scope->depth ());
    EXPECT_EQ (4, scope->addNode ("a.b.c.d").depth ());

    unique_ptr<Node> inner (c.with ({{"k", Value ("v")}}));
    EXPECT_EQ (0, inner->depth ());
    EXPECT_EQ (4, inner->getNode ("a.b.c.k").depth ());
}

TEST (NodeTest, KeyPath)
{
    unique_ptr<Node> root (Node::newRoot ());
    Node & n = root->set ("suffix:(of house)", "settings", 2, 3041, "s", "value");
    vector<string> expected {"settings", "2", "3041", "s", "value"};
    EXPECT_EQ (expected, n.keyPath ());
    EXPECT_EQ ("settings.2.3041.s.value", n.keyPathString ());
    EXPECT_TRUE (root->keyPath ().empty ());
    EXPECT_EQ (root.get (), &n.root ());
}

TEST (NodeTest, Merge)
{
    Node point ("point");
    point.set (Value ("value"));
    unique_ptr<Node> root (Node::newRoot ());
    Node & result = root->merge (point);
    EXPECT_EQ ("{point=value}", root->toString ());
    EXPECT_NE (&point, &result);
    EXPECT_EQ (root.get (), &result.parent ());

    EXPECT_EQ (&Node::none, &root->merge (Node::none));
}

TEST (NodeTest, MergeIsAdditive)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set (1, "a.x");
    root->set (2, "a.y");
    root->set (9, "b");

    Node source ("a");
    source.set (3, "z");
    root->merge (source);
    EXPECT_EQ ("{a={x=1,y=2,z=3},b=9}", root->toString ());

    // The source value overwrites even when it is NONE.
    root->set ("old", "a");
    root->merge (source);
    EXPECT_TRUE (root->getNode ("a").value ().empty ());
    EXPECT_EQ (3, root->getInt ("a.z"));
}

TEST (NodeTest, MergeDeepCopies)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("1", "src.a.b");
    root->set ("2", "src.a.c");

    unique_ptr<Node> other (Node::newRoot ());
    other->merge (root->getNode ("src"));
    root->set ("changed", "src.a.b");

    EXPECT_EQ ("{src={a={b=1,c=2}}}", other->toString ());
}

TEST (NodeTest, Adopt)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->addNode ("main");
    Node * c = new Node ("child");
    root->getNode ("main").adopt (c);
    EXPECT_EQ ("{main={child=}}", root->toString ());
    EXPECT_EQ (2, c->depth ());

    // Last adopted wins.
    root->set ("old", "a");
    Node * a = new Node ("a");
    a->set (Value ("new"));
    root->adopt (a);
    EXPECT_EQ ("{main={child=},a=new}", root->toString ());

    // Adopting an attached node moves it.
    unique_ptr<Node> other (Node::newRoot ());
    other->adopt (c);
    EXPECT_EQ ("{main=,a=new}", root->toString ());
    EXPECT_EQ ("{child=}", other->toString ());
    EXPECT_EQ (other.get (), &c->parent ());
}

TEST (NodeTest, DetachAndReattach)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set (1, "a.b.c");
    root->set (2, "a.b.d");
    root->set (3, "a.e");

    unique_ptr<Node> b (root->unset ("a.b"));
    ASSERT_TRUE (b != nullptr);
    EXPECT_EQ (0, b->depth ());
    EXPECT_EQ (&Node::none, &b->parent ());
    EXPECT_EQ ("{a={e=3}}", root->toString ());

    unique_ptr<Node> other (Node::newRoot ());
    other->addNode ("x.y").adopt (b.release ());
    EXPECT_EQ ("{x={y={b={c=1,d=2}}}}", other->toString ());
    EXPECT_EQ (3, other->getNode ("x.y.b").depth ());
    EXPECT_EQ (4, other->getNode ("x.y.b.c").depth ());

    EXPECT_EQ (nullptr, root->unset ("a.b"));
    EXPECT_EQ (nullptr, root->unset ("q.r.s"));
    EXPECT_EQ (nullptr, root->unset ());
}

TEST (NodeTest, PushValues)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->addNode ("list").pushValues ({Value ("a"), Value ("b")});
    EXPECT_EQ ("{list={1=a,2=b}}", root->toString ());

    unique_ptr<Node> same (Node::newRoot ());
    same->set ("a", "list.1");
    same->set ("b", "list.2");
    EXPECT_EQ (same->toString (), root->toString ());

    delete root->unset ("list.1");
    root->getNode ("list").push ().set (Value ("c"));
    EXPECT_EQ ("{list={2=b,3=c}}", root->toString ());
}

TEST (NodeTest, FillKey)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->fillKey ("a", 10);
    EXPECT_EQ ("{a=10}", root->toString ());
    root->fillKey ("a", 20);
    EXPECT_EQ ("{a={1=10,2=20}}", root->toString ());
    root->fillKey ("a", 30);
    EXPECT_EQ ("{a={1=10,2=20,3=30}}", root->toString ());

    root->fillKey ("b.c", 3.14);
    EXPECT_DOUBLE_EQ (3.14, root->getDouble ("b.c"));
}

TEST (NodeTest, SortNumeric)
{
    unique_ptr<Node> root (Node::newRoot ());
    const char * keys[] = {"30", "001", "01", "1", "3"};
    for (auto k : keys) root->set (k, "n", k);
    root->getNode ("n").sort ();
    vector<string> expected {"001", "01", "1", "3", "30"};
    EXPECT_EQ (expected, root->getNode ("n").childKeys ());
}

TEST (NodeTest, SortLexicographic)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set (1, "b");
    root->set (2, "a");
    root->set (3, "10x");
    root->sort ();
    vector<string> expected {"10x", "a", "b"};
    EXPECT_EQ (expected, root->childKeys ());
}

TEST (NodeTest, SortRecursively)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("a", "item.30.name");
    root->set ("b", "item.001");
    root->set ("c", "item.01");
    root->set ("d", "item.1.name");
    root->set ("e", "item.002");
    root->set ("f", "item.0020.name");
    root->set ("g", "item.3.name");
    root->set ("30s", "server.timeout");
    root->set ("0.2", "sales.vat");
    root->sortRecursively ();

    ostringstream out;
    root->dump (out, false);
    EXPECT_EQ
    (
        "item.001=b\n"
        "item.01=c\n"
        "item.1.name=d\n"
        "item.002=e\n"
        "item.3.name=g\n"
        "item.0020.name=f\n"
        "item.30.name=a\n"
        "sales.vat=0.2\n"
        "server.timeout=30s\n",
        out.str ()
    );
}

TEST (NodeTest, Iterate)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set ("one",   "main.1");
    root->set ("two",   "main.2");
    root->set ("three", "main.3");

    vector<string> seen;
    for (auto & c : root->getNode ("main")) seen.push_back (c.key ());
    vector<string> expected {"1", "2", "3"};
    EXPECT_EQ (expected, seen);

    // Removing children while iterating is safe.
    Node & list = root->getNode ("main");
    for (auto & c : list)
    {
        if (&c == &Node::none) continue;
        delete list.unset (c.key ());
    }
    EXPECT_EQ (0, list.size ());
    EXPECT_TRUE (list.isLeaf ());

    int count = 0;
    for (auto & c : Node::none) if (&c != &Node::none) count++;
    EXPECT_EQ (0, count);
}

TEST (NodeTest, Visit)
{
    unique_ptr<Node> root (Node::newRoot ());
    root->set (1, "a.b");
    root->set (2, "a.c.d");
    root->set (3, "e");

    struct Counter : public Node::Visitor
    {
        int leaves = 0;
        virtual bool visit (Node & node)
        {
            if (node.isLeaf ()) leaves++;
            return node.key () != "c";  // prune below "c"
        }
    } counter;
    root->visit (counter);
    EXPECT_EQ (2, counter.leaves);
}

TEST (NodeTest, FromArgs)
{
    unique_ptr<Node> root (Node::fromArgs ({{"a.b", Value (1)}, {"c", Value ("x")}}));
    EXPECT_EQ ("{a={b=1},c=x}", root->toString ());
    EXPECT_TRUE ((root->flags & Node::IsRoot) != 0);
}

TEST (NodeTest, NoneIsInert)
{
    EXPECT_THROW (Node::none.set (Value (1)), const char *);
    EXPECT_THROW (Node::none.set (1, "a"), const char *);
    EXPECT_EQ (&Node::none, &Node::none.getNode ("a"));
    EXPECT_TRUE (Node::none.getNodes ("*").empty ());
    EXPECT_EQ (&Node::none, &Node::none.rename ("x"));
    EXPECT_EQ (0, Node::none.size ());
    EXPECT_EQ ("{}", Node::none.toString ());
}
