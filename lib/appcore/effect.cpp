#include "effect.hpp"

#include <exception>

#include <spdlog/spdlog.h>

Effect immediate(Message message) {
  Effect effect;
  effect.kind = EffectKind::Immediate;
  effect.label = "message";
  effect.run = [message = std::move(message)](EffectContext &) {
    return message;
  };
  return effect;
}

Effect makeEffect(EffectKind kind, std::string label,
                  std::function<Message(EffectContext &)> run,
                  std::function<Message(const std::string &)> on_exception) {
  Effect effect;
  effect.kind = kind;
  effect.label = std::move(label);
  effect.run = std::move(run);
  effect.onException = std::move(on_exception);
  return effect;
}

Message runEffect(const Effect &effect, EffectContext &context) {
  try {
    return effect.run(context);
  } catch (const std::exception &e) {
    spdlog::error("{} failed: {}", effect.label, e.what());
    if (effect.onException)
      return effect.onException(e.what());
    return EffectFailed{effect.label, e.what()};
  }
}
