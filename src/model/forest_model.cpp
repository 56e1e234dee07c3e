#include "model/forest_model.h"
#include "analysis/url_features.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

bool ForestModel::load(const std::string& path, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str(), error);
}

bool ForestModel::parse(const std::string& text, std::string& error) {
    std::vector<ForestTree> trees;

    try {
        json root = json::parse(text);

        if (root.value("format", std::string()) != "random_forest") {
            error = "unsupported model format";
            return false;
        }

        int version = root.value("schema_version", 0);
        if (version != kFeatureSchemaVersion) {
            error = "schema_version " + std::to_string(version) +
                    " does not match feature schema " +
                    std::to_string(kFeatureSchemaVersion);
            return false;
        }

        auto names = root.at("features").get<std::vector<std::string>>();
        if (names != featureSchemaNames()) {
            error = "feature list does not match schema v" +
                    std::to_string(kFeatureSchemaVersion);
            return false;
        }

        const json& jtrees = root.at("trees");
        if (!jtrees.is_array() || jtrees.empty()) {
            error = "model has no trees";
            return false;
        }

        const int featureCount = static_cast<int>(names.size());

        for (const auto& jt : jtrees) {
            const json& jnodes = jt.at("nodes");
            if (!jnodes.is_array() || jnodes.empty()) {
                error = "tree " + std::to_string(trees.size()) + " has no nodes";
                return false;
            }

            ForestTree tree;
            const int n = static_cast<int>(jnodes.size());
            tree.nodes.resize(n);

            for (int i = 0; i < n; ++i) {
                const json& jn = jnodes[i];
                ForestNode& node = tree.nodes[i];

                if (jn.contains("value")) {
                    auto v = jn.at("value").get<std::vector<double>>();
                    if (v.size() != 2 || v[0] < 0.0 || v[1] < 0.0) {
                        error = "leaf " + std::to_string(i) + " needs two non-negative class weights";
                        return false;
                    }
                    node.leaf = true;
                    node.proba[0] = v[0];
                    node.proba[1] = v[1];
                    continue;
                }

                node.leaf = false;
                node.feature = jn.at("feature").get<int>();
                node.threshold = jn.at("threshold").get<double>();
                node.left = jn.at("left").get<int>();
                node.right = jn.at("right").get<int>();

                if (node.feature < 0 || node.feature >= featureCount) {
                    error = "node " + std::to_string(i) + " splits on unknown feature";
                    return false;
                }
                if (node.left <= i || node.left >= n ||
                    node.right <= i || node.right >= n) {
                    error = "node " + std::to_string(i) + " has out-of-order children";
                    return false;
                }
            }
            trees.push_back(std::move(tree));
        }

        schemaVersion_ = version;
        featureCount_ = names.size();
    } catch (const std::exception& e) {
        error = std::string("malformed model: ") + e.what();
        return false;
    }

    trees_ = std::move(trees);
    return true;
}

double ForestModel::maliciousProbability(const std::vector<double>& x) const {
    if (trees_.empty() || x.size() != featureCount_)
        return 0.5;

    double benign = 0.0;
    double malicious = 0.0;
    for (const auto& t : trees_) {
        int i = 0;
        while (!t.nodes[i].leaf) {
            const auto& nd = t.nodes[i];
            i = (x[nd.feature] <= nd.threshold) ? nd.left : nd.right;
        }
        const auto& leaf = t.nodes[i];
        double z = leaf.proba[0] + leaf.proba[1];
        if (z <= 0.0)
            continue;
        benign += leaf.proba[0] / z;
        malicious += leaf.proba[1] / z;
    }

    double total = benign + malicious;
    if (total <= 0.0)
        return 0.5;
    return malicious / total;
}
