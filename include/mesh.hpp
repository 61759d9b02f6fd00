#pragma once
#include <vector>
#include <string>
#include <array>
#include <limits>

struct Node {
    double x, y;
};

// Polygonal cell; vertices in file order.
struct Element {
    std::vector<int> vid;
    int tag = 0;  // Gmsh element tag, used to key $ElementData
};

// One $ElementData view: a named scalar at one vertical level.
struct ElementDataBlock {
    std::string name;
    int level = 0;  // Gmsh time-step integer tag
    std::vector<std::pair<int, double>> values;  // (element tag, value)
};

class Mesh {
public:
    bool load_gmsh(const std::string& path);
    size_t num_nodes() const { return nodes.size(); }
    size_t num_elements() const { return elems.size(); }
    const Node& node(size_t i) const { return nodes[i]; }
    const Element& element(size_t e) const { return elems[e]; }
    const std::vector<ElementDataBlock>& element_data() const { return data_blocks; }
    // $Comments text, newest line first; empty when the file has none.
    const std::string& history() const { return comments; }

    int add_node(double x, double y);
    int add_element(const std::vector<int>& vid);
    void add_element_data(const ElementDataBlock& block) { data_blocks.push_back(block); }

    std::array<double, 2> element_centroid(size_t e) const;

    double xmin() const { return _xmin; }
    double xmax() const { return _xmax; }
    double ymin() const { return _ymin; }
    double ymax() const { return _ymax; }

private:
    void read_element_data(std::istream& in);
    void track_bounds(double x, double y);

    std::vector<Node> nodes;
    std::vector<Element> elems;
    std::vector<ElementDataBlock> data_blocks;
    std::string comments;

    double _ymin = std::numeric_limits<double>::max();
    double _ymax = -std::numeric_limits<double>::max();
    double _xmin = std::numeric_limits<double>::max();
    double _xmax = -std::numeric_limits<double>::max();
};
