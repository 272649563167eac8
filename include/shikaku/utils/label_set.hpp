#ifndef SHIKAKU_LABEL_SET_HPP
#define SHIKAKU_LABEL_SET_HPP

#include <string>
#include <vector>

namespace shikaku {

// Index i names output component i of the model.
using LabelSet = std::vector<std::string>;

// Class names are the sub-directories of dataset_root, sorted ascending.
// This must reproduce the class index assignment used when training on the
// same directory tree.
LabelSet build_label_set(const std::string& dataset_root);

} // namespace shikaku

#endif // SHIKAKU_LABEL_SET_HPP
