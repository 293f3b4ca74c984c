#pragma once

#include <functional>
#include <optional>
#include <string>

namespace mosaic {

class DialogService {
public:
  using PromptDone = std::function<void(std::optional<std::string> answer)>;
  using ConfirmDone = std::function<void(bool accepted)>;

  virtual ~DialogService() = default;

  // An empty optional means the user dismissed the prompt.
  virtual void Prompt(const std::string& message, const std::string& defaultValue,
                      PromptDone done) = 0;
  virtual void Confirm(const std::string& message, ConfirmDone done) = 0;
};

}  // namespace mosaic
