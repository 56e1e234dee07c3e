#pragma once
#include <string>
#include <vector>

struct ForestNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    bool leaf = true;
    double proba[2] = {0.0, 0.0};   // benign, malicious
};

struct ForestTree {
    std::vector<ForestNode> nodes;
};

// Binary random forest exported as JSON:
//
//   { "format": "random_forest", "schema_version": 1,
//     "features": ["url_length", ...],
//     "trees": [ { "nodes": [
//        { "feature": 0, "threshold": 75.5, "left": 1, "right": 2 },
//        { "value": [12, 3] }, ... ] } ] }
//
// Children must point forward within their tree, which makes every walk
// terminate; load() rejects anything else.
class ForestModel {
public:
    bool load(const std::string& path, std::string& error);
    bool parse(const std::string& text, std::string& error);

    // x must follow the schema order the model was loaded with.
    double maliciousProbability(const std::vector<double>& x) const;

    size_t treeCount() const { return trees_.size(); }
    int schemaVersion() const { return schemaVersion_; }

private:
    std::vector<ForestTree> trees_;
    int schemaVersion_ = 0;
    size_t featureCount_ = 0;
};
