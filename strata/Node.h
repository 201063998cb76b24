/*
A hierarchical key-value store for configuration data. Trees can be stacked
into scopes, so that a child scope sees every key of its ancestor scope that
it does not set itself.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#ifndef strata_node_h
#define strata_node_h

#include "Value.h"
#include "Key.h"
#include "NodeList.h"
#include "Reply.h"
#include "Args.h"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <iterator>
#include <iostream>
#include <cstdint>

#include "shared.h"


namespace strata
{
    class SHARED Node;

    typedef std::map<std::string, std::string> StrArgs;

    /**
        A named node carrying one Value and an ordered set of named children.

        <p>Children are owned by their container and are released when it is destroyed.
        A node removed with unset() is owned by the caller, who must delete it or adopt
        it somewhere else. Child order is insertion order unless sort() is called.

        <p>Most accessors take a key list. Each key is split on ".", and the resulting
        segments are matched one level at a time. A segment of "*" matches every child.
        A literal segment matches the child with that exact key, and also a child
        literally named "*", so a tree may hold fallback entries. When a scope has no
        match, the search continues in the scope it was created from.

        <p>This class does no locking. Callers that share a tree between threads must
        synchronize externally.
    **/
    class SHARED Node
    {
    public:
        static Node none;  // For return values, indicating node does not exist. Iterating over none will produce no children.

        // Flags
        static const uint8_t ForceMap   = 0x1;  ///< Serialize as a JSON object even if all keys are numeric.
        static const uint8_t ForceArray = 0x2;  ///< Serialize as a JSON array regardless of keys.
        static const uint8_t IsRoot     = 0x4;  ///< Top of a scope. Ends upward walks by depth(), keyPath() and root().

        uint8_t flags;

        Node (const std::string & key = "", uint8_t flags = 0);
        ~Node ();

        /**
            Creates an empty scope root. The caller owns the result.
        **/
        static Node * newRoot ();

        /**
            Creates a scope root populated by mergeArgs(). The caller owns the result.
        **/
        static Node * fromArgs (const Args & args);

        /**
            Creates a scope root loaded from a configuration file with mergeFile().
            On failure, writes the file name to stderr after the loader's own message
            and throws. Nothing is returned in that case. The caller owns the result.
        **/
        static Node * mustLoad (const std::string & filename);

        const std::string & key () const;
        const Value &       value () const;

        /**
            Replaces this node's own value. Unlike set(value,keys), a NONE value does erase.
        **/
        void set (const Value & value);

        /**
            The structural container of this node, or none if it is detached.
            The container of a scope root is none. See scopeParent().
        **/
        Node & parent () const;

        /**
            For a scope root, the root of the scope it inherits from. Otherwise none.
        **/
        Node & scopeParent () const;

        /**
            Climbs containers until reaching a node flagged IsRoot or a node with no container.
        **/
        Node & root ();

        /**
            Number of container hops up to root().
        **/
        int depth () const;

        /**
            Keys from just below root() down to this node. Has depth() entries.
        **/
        std::vector<std::string> keyPath () const;
        std::string              keyPathString () const;

        int                      size () const;
        bool                     isLeaf () const;     ///< True if this node has no children.
        std::vector<std::string> childKeys () const;  ///< A copy of the current child order.

        /**
            Returns an immediate child by exact key, or none.
            Neither wildcards nor scopes are consulted.
        **/
        Node & child (const std::string & key) const;

        // Structure ---------------------------------------------------------

        /**
            Takes ownership of the given node as a child of this one.
            The node is first detached from any previous container. An existing child
            with the same key is destroyed and replaced. The new child goes to the end
            of the child order.
        **/
        void adopt (Node * child);

        /**
            Detaches the node at the given path and returns it, or returns nullptr if
            the path does not exist. Only exact keys are followed. The caller takes
            ownership of the result.
        **/
        Node * unset (const std::vector<Key> & keys);
        template<typename... Keys> Node * unset (Keys... keys) {return unset (std::vector<Key> {keys...});}

        /**
            Changes the key of this node, keeping its value and children.
            If the node has a container, it moves to the end of the container's child
            order, replacing any sibling that already had the new key.
        **/
        Node & rename (const std::string & newKey);

        /**
            Deep copies source into the child of this node that has the same key,
            creating it if needed. Values are always overwritten, even by NONE.
            Children of this node not present in source are left alone.
            When a child is created, this node's child order is sorted.
            @return The destination child, or none if source is none.
        **/
        Node & merge (const Node & source);

        /**
            Orders children numerically if every key is an integer, otherwise
            lexicographically. Numeric sorting is stable.
        **/
        void sort ();
        void sortRecursively ();

        /**
            Creates a new scope that inherits from this node's root. When called on an
            interior node, the arguments are placed under the same key path in the new
            scope. The caller owns the result, and this tree must outlive it.
        **/
        Node * with (const Args & args = Args ());

        /**
            Finds or creates the node at the given path and assigns its value.
            A NONE value leaves the existing value in place.
            @return The node at the path, or none if the path is empty.
        **/
        Node & set (const Value & value, const std::vector<Key> & keys);
        template<typename... Keys> Node & set (const Value & value, Keys... keys) {return set (value, std::vector<Key> {keys...});}

        /**
            Finds or creates the node at the given path without touching its value.
        **/
        Node & addNode (const std::vector<Key> & keys);
        template<typename... Keys> Node & addNode (Keys... keys) {return addNode (std::vector<Key> {keys...});}

        /**
            Sets a value which may repeat. The first call stores the value directly on
            the node. Later calls turn the node into a list of numbered children
            (1, 2, ...), moving the original value into the first one.
        **/
        Node & fillKey (const Key & key, const Value & value);

        /**
            Adds a child keyed by the next integer not already in use, counting up
            from the number of children.
        **/
        Node & push ();
        Node & pushValues (const std::vector<Value> & values);

        Node & mergeArgs (const Args & args);

        // Path resolution ---------------------------------------------------

        /**
            Collects every node matching the given path segments, searching this scope
            and then each inherited scope in turn. Results from nearer scopes come first.
            @param limit Stop as soon as this many nodes are collected. 0 means no limit.
        **/
        NodeList resolve (const std::vector<std::string> & path, int limit = 0);

        /**
            The first node that matches, or none.
        **/
        Node & find (const std::vector<std::string> & path);

        NodeList getNodes (const std::vector<Key> & keys);
        template<typename... Keys> NodeList getNodes (Keys... keys) {return getNodes (std::vector<Key> {keys...});}

        // Settings ----------------------------------------------------------

        /**
            Evaluates the settings groups found at the given path against the values
            of this node. Each group holds numbered cases. A case either has a "default"
            payload or selects one through its "keys": the listed context keys are looked
            up in this node, and their values form a path (ending in "value") below the
            case. A key written as "?name" contributes "true" or "false" depending on
            whether the context has it. A payload is a comma-separated list of
            "subkey:value" items, where a missing subkey means "value". Evaluation of a
            group stops at the first case that matches, unless that case sets "continue".
            When the path ends in "*", every reply key is prefixed by the group's key.
        **/
        Reply getSettings (const std::vector<Key> & keys);
        template<typename... Keys> Reply getSettings (Keys... keys) {return getSettings (std::vector<Key> {keys...});}

        // Getters -----------------------------------------------------------
        // Every getter finds the first node matching the key list. An empty key list
        // refers to this node itself.

        Node & getNode (const std::vector<Key> & keys);
        template<typename... Keys> Node & getNode (Keys... keys) {return getNode (std::vector<Key> {keys...});}

        Node & getNodeOrDefault (Node & defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> Node & getNodeOrDefault (Node & defaultValue, Keys... keys) {return getNodeOrDefault (defaultValue, std::vector<Key> {keys...});}

        /**
            Try-style getters store the converted value in result and return nullptr,
            or return a static message and leave result unchanged.
        **/
        const char * tryGetNode (Node * & result, const std::vector<Key> & keys);
        const char * tryGet     (Value       & result, const std::vector<Key> & keys);
        const char * tryGet     (std::string & result, const std::vector<Key> & keys);
        const char * tryGet     (int         & result, const std::vector<Key> & keys);
        const char * tryGet     (long        & result, const std::vector<Key> & keys);
        const char * tryGet     (double      & result, const std::vector<Key> & keys);
        const char * tryGet     (bool        & result, const std::vector<Key> & keys);
        const char * tryGet     (Duration    & result, const std::vector<Key> & keys);
        const char * tryGet     (Time        & result, const std::vector<Key> & keys);
        template<typename... Keys> const char * tryGetNode (Node * & result, Keys... keys) {return tryGetNode (result, std::vector<Key> {keys...});}
        template<typename T, typename... Keys> const char * tryGet (T & result, Keys... keys) {return tryGet (result, std::vector<Key> {keys...});}

        Value get (const std::vector<Key> & keys);
        template<typename... Keys> Value get (Keys... keys) {return get (std::vector<Key> {keys...});}

        std::string getString (const std::vector<Key> & keys);
        template<typename... Keys> std::string getString (Keys... keys) {return getString (std::vector<Key> {keys...});}

        int getInt (const std::vector<Key> & keys);
        template<typename... Keys> int getInt (Keys... keys) {return getInt (std::vector<Key> {keys...});}

        long getLong (const std::vector<Key> & keys);
        template<typename... Keys> long getLong (Keys... keys) {return getLong (std::vector<Key> {keys...});}

        double getDouble (const std::vector<Key> & keys);
        template<typename... Keys> double getDouble (Keys... keys) {return getDouble (std::vector<Key> {keys...});}

        /**
            Interprets value as boolean: 1, t, true, on (in any case) are true.
            Anything else, including a missing node, is false.
        **/
        bool getBool (const std::vector<Key> & keys);
        template<typename... Keys> bool getBool (Keys... keys) {return getBool (std::vector<Key> {keys...});}

        Duration getDuration (const std::vector<Key> & keys);
        template<typename... Keys> Duration getDuration (Keys... keys) {return getDuration (std::vector<Key> {keys...});}

        Time getTime (const std::vector<Key> & keys);
        template<typename... Keys> Time getTime (Keys... keys) {return getTime (std::vector<Key> {keys...});}

        std::string getOrDefault (const char * defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> std::string getOrDefault (const char * defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        std::string getOrDefault (const std::string & defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> std::string getOrDefault (const std::string & defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        int getOrDefault (int defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> int getOrDefault (int defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        long getOrDefault (long defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> long getOrDefault (long defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        double getOrDefault (double defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> double getOrDefault (double defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        bool getOrDefault (bool defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> bool getOrDefault (bool defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        Duration getOrDefault (Duration defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> Duration getOrDefault (Duration defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        Time getOrDefault (Time defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> Time getOrDefault (Time defaultValue, Keys... keys) {return getOrDefault (defaultValue, std::vector<Key> {keys...});}

        /// Returns the matched node's value as is, or defaultValue if no node matches.
        Value getValueOrDefault (const Value & defaultValue, const std::vector<Key> & keys);
        template<typename... Keys> Value getValueOrDefault (const Value & defaultValue, Keys... keys) {return getValueOrDefault (defaultValue, std::vector<Key> {keys...});}

        /**
            Must-style getters are intended for initialization. If the node is missing or
            its value can't be converted, they write the key path and reason to stderr
            and throw.
        **/
        Node & mustGetNode (const std::vector<Key> & keys);
        template<typename... Keys> Node & mustGetNode (Keys... keys) {return mustGetNode (std::vector<Key> {keys...});}

        Value mustGet (const std::vector<Key> & keys);
        template<typename... Keys> Value mustGet (Keys... keys) {return mustGet (std::vector<Key> {keys...});}

        std::string mustGetString (const std::vector<Key> & keys);
        template<typename... Keys> std::string mustGetString (Keys... keys) {return mustGetString (std::vector<Key> {keys...});}

        int mustGetInt (const std::vector<Key> & keys);
        template<typename... Keys> int mustGetInt (Keys... keys) {return mustGetInt (std::vector<Key> {keys...});}

        double mustGetDouble (const std::vector<Key> & keys);
        template<typename... Keys> double mustGetDouble (Keys... keys) {return mustGetDouble (std::vector<Key> {keys...});}

        bool mustGetBool (const std::vector<Key> & keys);
        template<typename... Keys> bool mustGetBool (Keys... keys) {return mustGetBool (std::vector<Key> {keys...});}

        Duration mustGetDuration (const std::vector<Key> & keys);
        template<typename... Keys> Duration mustGetDuration (Keys... keys) {return mustGetDuration (std::vector<Key> {keys...});}

        Time mustGetTime (const std::vector<Key> & keys);
        template<typename... Keys> Time mustGetTime (Keys... keys) {return mustGetTime (std::vector<Key> {keys...});}

        /**
            Values of every matching node that has no children.
        **/
        std::vector<Value> getValues (const std::vector<Key> & keys);
        template<typename... Keys> std::vector<Value> getValues (Keys... keys) {return getValues (std::vector<Key> {keys...});}

        /**
            String form of the value of every matching node.
        **/
        std::vector<std::string> getStringValues (const std::vector<Key> & keys);
        template<typename... Keys> std::vector<std::string> getStringValues (Keys... keys) {return getStringValues (std::vector<Key> {keys...});}

        /**
            For a path such as "*.*.common.region.*.name", matches everything up to and
            including the last "*", then looks up the rest of the path under each match.
            The result maps the key of each match to the string value found below it.
            With no keys, the path is "*". Without any "*", only the first segment is
            used to select matches.
        **/
        Args getMap (const std::vector<Key> & keys);
        template<typename... Keys> Args getMap (Keys... keys) {return getMap (std::vector<Key> {keys...});}

        StrArgs getStringMap (const std::vector<Key> & keys);
        template<typename... Keys> StrArgs getStringMap (Keys... keys) {return getStringMap (std::vector<Key> {keys...});}

        // Streams -----------------------------------------------------------

        /**
            Loads a configuration file and merges its entries under this node.
            Relative include directives are resolved against the directory of the
            including file, and each file is read at most once. If loading fails,
            the reason is written to stderr and an exception is thrown. Entries read
            before the failure remain in the tree.
        **/
        void mergeFile (const std::string & filename);

        /**
            Reads entries from a stream and merges them under this node.
            Include directives are not supported here.
            @param stopOnErrors If true, an unrecognized line throws. Otherwise such
            lines are skipped.
        **/
        void mergeReader (std::istream & reader, bool stopOnErrors = true);

        /**
            Writes this subtree.
            @param shortForm true for a single line such as "{a={b=1},c=2}".
            false for one "path=value" line per leaf.
        **/
        void dump (std::ostream & out, bool shortForm = true) const;
        std::string toString () const;  ///< Short form of dump()

        struct Iterator
        {
            using iterator_category = std::input_iterator_tag;
            using difference_type   = int;
            using value_type        = Node;
            using pointer           = Node *;
            using reference         = Node &;

            const Node &                              container;
            // A copy of the keys, so that the caller may delete nodes in the middle of iteration.
            // Dereferencing the iterator could return none.
            std::shared_ptr<std::vector<std::string>> keys;
            size_t                                    i;  // position in keys

            Iterator (const Node & container)
            :   container (container),
                keys (std::make_shared<std::vector<std::string>> ()),
                i (0)
            {
            }

            reference operator* ()
            {
                return container.child ((*keys)[i]);
            }

            pointer operator-> ()
            {
                return & container.child ((*keys)[i]);
            }

            Iterator & operator++ ()
            {
                i++;
                return *this;
            }

            Iterator operator++ (int)
            {
                Iterator result = *this;
                i++;
                return result;
            }

            friend bool operator== (const Iterator & a, const Iterator & b)
            {
                if (&a.container != &b.container) return false;
                bool aDone =  a.i >= a.keys->size ();
                bool bDone =  b.i >= b.keys->size ();
                if (aDone != bDone) return false;
                if (aDone) return true;
                return (*a.keys)[a.i] == (*b.keys)[b.i];
            }

            friend bool operator!= (const Iterator & a, const Iterator & b)
            {
                return ! (a == b);
            }
        };

        Iterator begin () const;
        Iterator end () const;

        struct Visitor
        {
            /**
                @param node Any of value or children may be modified during this visit.
                @return true to recurse below current node. false if further recursion below this node is not needed.
            **/
            virtual bool visit (Node & node) = 0;
        };

        /**
            Execute some operation on each node in the tree. Traversal is depth-first, pre-order.
        **/
        void visit (Visitor & v);

    protected:
        std::string                   name;
        Value                         content;
        Node *                        container;  ///< Structural parent. Not owned.
        Node *                        scope;      ///< Only on an IsRoot node: the root this scope inherits from. Not owned.
        std::map<std::string, Node *> children;
        std::vector<std::string>      order;      ///< Keys of children, in iteration order

        Node &   childGet   (const std::string & key, bool create = false);
        Node *   childTake  (const std::string & key);  ///< Detaches the child and hands ownership to the caller.
        bool     hasOnlyNumericKeys () const;
        bool     matchPath  (const std::vector<std::string> & path, size_t index, size_t limit, NodeList & result);
        bool     matchChild (Node & c, const std::vector<std::string> & path, size_t index, size_t limit, NodeList & result);

    private:
        Node (const Node &);  // Not copyable. Use merge() to copy a subtree.
        Node & operator= (const Node &);
    };

    SHARED std::ostream & operator<< (std::ostream & out, const Node & node);
}

#endif
