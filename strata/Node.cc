/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Node.h"
#include "strings.h"

#include <algorithm>
#include <sstream>

using namespace std;


strata::Node strata::Node::none;


// class Node ----------------------------------------------------------------

strata::Node::Node (const string & key, uint8_t flags)
:   flags     (flags),
    name      (key),
    container (nullptr),
    scope     (nullptr)
{
}

strata::Node::~Node ()
{
    for (auto c : children) delete c.second;
}

strata::Node *
strata::Node::newRoot ()
{
    return new Node ("", IsRoot);
}

strata::Node *
strata::Node::fromArgs (const Args & args)
{
    Node * result = newRoot ();
    result->mergeArgs (args);
    return result;
}

const string &
strata::Node::key () const
{
    return name;
}

const strata::Value &
strata::Node::value () const
{
    return content;
}

void
strata::Node::set (const Value & value)
{
    if (this == &none) throw "Attempt to assign a value to none";
    content = value;
}

strata::Node &
strata::Node::parent () const
{
    if (container) return *container;
    return none;
}

strata::Node &
strata::Node::scopeParent () const
{
    if (scope  &&  (flags & IsRoot)) return *scope;
    return none;
}

strata::Node &
strata::Node::root ()
{
    Node * result = this;
    while (result->container  &&  ! (result->flags & IsRoot)) result = result->container;
    return *result;
}

int
strata::Node::depth () const
{
    int result = 0;
    const Node * n = this;
    while (n->container  &&  ! (n->flags & IsRoot))
    {
        result++;
        n = n->container;
    }
    return result;
}

vector<string>
strata::Node::keyPath () const
{
    int index = depth ();
    vector<string> result (index);
    const Node * n = this;
    while (index > 0)
    {
        result[--index] = n->name;
        n = n->container;
    }
    return result;
}

string
strata::Node::keyPathString () const
{
    return join (".", keyPath ());
}

int
strata::Node::size () const
{
    return order.size ();
}

bool
strata::Node::isLeaf () const
{
    return order.empty ();
}

vector<string>
strata::Node::childKeys () const
{
    return order;
}

strata::Node &
strata::Node::child (const string & key) const
{
    auto it = children.find (key);
    if (it == children.end ()) return none;
    return *it->second;
}

strata::Node &
strata::Node::childGet (const string & key, bool create)
{
    auto it = children.find (key);
    if (it != children.end ()) return *it->second;
    if (! create) return none;
    if (this == &none) throw "Attempt to create a child under none";
    Node * result = new Node (key);
    adopt (result);
    return *result;
}

strata::Node *
strata::Node::childTake (const string & key)
{
    auto it = children.find (key);
    if (it == children.end ()) return nullptr;
    Node * result = it->second;
    children.erase (it);
    auto o = std::find (order.begin (), order.end (), key);
    if (o != order.end ()) order.erase (o);
    result->container = nullptr;
    return result;
}

void
strata::Node::adopt (Node * child)
{
    if (this == &none) throw "Attempt to adopt a child into none";
    if (! child  ||  child == &none  ||  child == this) return;

    if (child->container) child->container->childTake (child->name);
    delete childTake (child->name);  // Evict any sibling with the same key.

    children[child->name] = child;
    order.push_back (child->name);
    child->container = this;
}

strata::Node *
strata::Node::unset (const vector<Key> & keys)
{
    vector<string> path = parseKeys (keys);
    if (path.empty ()) return nullptr;
    Node * c = this;
    size_t last = path.size () - 1;
    for (size_t i = 0; i < last; i++)
    {
        c = & c->child (path[i]);
        if (c == &none) return nullptr;
    }
    return c->childTake (path[last]);
}

strata::Node &
strata::Node::rename (const string & newKey)
{
    if (this == &none) return none;
    Node * p = container;
    if (p) p->childTake (name);
    name = newKey;
    if (p) p->adopt (this);
    return *this;
}

strata::Node &
strata::Node::merge (const Node & source)
{
    if (&source == &none) return none;
    if (this == &none) throw "Attempt to merge into none";

    Node * target = & childGet (source.name);
    if (target == &none)
    {
        target = & childGet (source.name, true);
        sort ();
    }
    target->content = source.content;
    for (auto & k : source.childKeys ())  // copy of keys, in case source is under target
    {
        Node & c = source.child (k);
        if (&c != &none) target->merge (c);
    }
    return *target;
}

bool
strata::Node::hasOnlyNumericKeys () const
{
    int64_t ignore;
    for (auto & k : order) if (! Value::parseInt (k, ignore)) return false;
    return true;
}

void
strata::Node::sort ()
{
    if (hasOnlyNumericKeys ())
    {
        stable_sort (order.begin (), order.end (), [] (const string & a, const string & b) -> bool
        {
            int64_t A = 0;
            int64_t B = 0;
            Value::parseInt (a, A);
            Value::parseInt (b, B);
            return A < B;
        });
    }
    else
    {
        std::sort (order.begin (), order.end ());
    }
}

void
strata::Node::sortRecursively ()
{
    struct Sorter : public Visitor
    {
        virtual bool visit (Node & node)
        {
            if (node.isLeaf ()) return false;
            node.sort ();
            return true;
        }
    } sorter;
    visit (sorter);
}

strata::Node *
strata::Node::with (const Args & args)
{
    if (this == &none) throw "Attempt to derive a scope from none";
    Node & r = root ();
    Node * result = newRoot ();
    result->scope = &r;

    Node * target = result;
    if (&r != this)
    {
        vector<Key> path;
        for (auto & k : keyPath ()) path.push_back (k);
        target = & result->addNode (path);
    }
    target->mergeArgs (args);
    return result;
}

strata::Node &
strata::Node::set (const Value & value, const vector<Key> & keys)
{
    vector<string> path = parseKeys (keys);
    if (path.empty ()) return none;
    Node * c = this;
    for (auto & k : path) c = & c->childGet (k, true);
    if (! value.empty ()) c->content = value;
    return *c;
}

strata::Node &
strata::Node::addNode (const vector<Key> & keys)
{
    return set (Value (), keys);
}

strata::Node &
strata::Node::fillKey (const Key & key, const Value & value)
{
    Node & c = addNode (key);
    if (&c == &none) return none;

    Node * result = nullptr;
    if (c.isLeaf ())
    {
        if (c.content.empty ())
        {
            result = &c;  // freshly created
        }
        else
        {
            c.push ().content = c.content;
            c.content = Value ();
        }
    }
    if (! result) result = & c.push ();
    result->content = value;
    return *result;
}

strata::Node &
strata::Node::push ()
{
    size_t id = order.size ();
    while (true)
    {
        string key = to_string (++id);
        if (children.count (key)) continue;
        return childGet (key, true);
    }
}

strata::Node &
strata::Node::pushValues (const vector<Value> & values)
{
    for (auto & v : values) push ().content = v;
    return *this;
}

strata::Node &
strata::Node::mergeArgs (const Args & args)
{
    for (auto & it : args) set (it.second, it.first);
    return *this;
}

strata::Node::Iterator
strata::Node::begin () const
{
    Iterator result (*this);
    *result.keys = order;  // To be safe for delete, these must be full copies of the strings.
    return result;
}

strata::Node::Iterator
strata::Node::end () const
{
    return Iterator (*this);
}

void
strata::Node::visit (Visitor & v)
{
    if (! v.visit (*this)) return;
    for (auto & c : *this)
    {
        if (&c != &none) c.visit (v);
    }
}

void
strata::Node::dump (ostream & out, bool shortForm) const
{
    struct Writer
    {
        ostream & out;
        bool      shortForm;

        void write (const Node & node, int level)
        {
            bool inner = shortForm  &&  level > 0;
            if (inner)
            {
                out << node.name << "=";
                if (! node.content.empty ()) out << node.content.toString ();
            }
            if (! node.order.empty ())
            {
                if (inner) out << "{";
                bool first = true;
                for (auto & k : node.order)
                {
                    if (shortForm  &&  ! first) out << ",";
                    first = false;
                    write (*node.children.at (k), level + 1);
                }
                if (inner) out << "}";
            }
            else if (! shortForm)
            {
                out << node.keyPathString () << "=" << node.content.toString () << "\n";
            }
        }
    } writer {out, shortForm};

    if (shortForm) out << "{";
    writer.write (*this, 0);
    if (shortForm) out << "}";
}

string
strata::Node::toString () const
{
    ostringstream result;
    dump (result, true);
    return result.str ();
}

ostream &
strata::operator<< (ostream & out, const Node & node)
{
    node.dump (out, true);
    return out;
}
