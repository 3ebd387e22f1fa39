#include "app/demo_steps.hpp"

#include <string>
#include "runtime/step.hpp"
#include "runtime/step_context.hpp"
#include "runtime/step_registry.hpp"

namespace station::app {

using core::errors::Result;
using runtime::StepContext;
using runtime::StepMetadata;
using runtime::StepVerdict;

namespace {

std::string describe(const protocol::Option& option) {
    return "{name: " + option.name + ", value: " + option.value.dump() + "}";
}

std::string describe(const std::vector<protocol::Option>& options) {
    std::string text = "[";
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += describe(options[i]);
    }
    return text + "]";
}

class EmptyStep : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("EmptyStep"); }

    Result<StepVerdict> run(StepContext& context) override {
        context.log("This goes to stdout");
        context.log_error("This goes to stderr");
        return StepVerdict::pass();
    }
};

class StepWithDisplayName : public runtime::Step {
public:
    static StepMetadata metadata() {
        return StepMetadata("StepWithDisplayName")
            .display_name("This is a custom display name");
    }

    Result<StepVerdict> run(StepContext&) override { return StepVerdict::pass(); }
};

class StepWithDescription : public runtime::Step {
public:
    static StepMetadata metadata() {
        return StepMetadata("StepWithDescription").description("This is a custom description");
    }

    Result<StepVerdict> run(StepContext&) override { return StepVerdict::pass(); }
};

class StepThatSetsState : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepThatSetsState"); }

    Result<StepVerdict> run(StepContext& context) override {
        context.log("Setting state...");
        context.state().set("Foo", std::string("Bar"));
        context.state().set("Baz", 42);
        return StepVerdict::pass();
    }
};

class StepThatReadsState : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepThatReadsState"); }

    Result<StepVerdict> run(StepContext& context) override {
        context.log("Reading state...");
        auto foo = context.state().get_as<std::string>("Foo");
        if (core::errors::is_error(foo)) {
            return core::errors::get_error(foo);
        }
        context.state().set("Baz", 42);
        auto baz = context.state().get_as<int>("Baz");
        if (core::errors::is_error(baz)) {
            return core::errors::get_error(baz);
        }
        context.log("Got foo: " + core::errors::get_value(foo) +
                    " and baz: " + std::to_string(core::errors::get_value(baz)));
        return StepVerdict::pass();
    }
};

class StepThatCanFail : public runtime::Step {
public:
    static StepMetadata metadata() {
        return StepMetadata("StepThatCanFail").stop_on_fail(false);
    }

    Result<StepVerdict> run(StepContext& context) override {
        context.log("This step fails");
        return StepVerdict::fail("demonstration failure");
    }
};

class StepWithImage : public runtime::Step {
public:
    static StepMetadata metadata() {
        return StepMetadata("StepWithImage").image("station/img/puppy.jpg");
    }

    Result<StepVerdict> run(StepContext&) override { return StepVerdict::pass(); }
};

class StepWithLink : public runtime::Step {
public:
    static StepMetadata metadata() {
        return StepMetadata("StepWithLink").link("https://www.example.com");
    }

    Result<StepVerdict> run(StepContext&) override { return StepVerdict::pass(); }
};

class StepWithLinkText : public runtime::Step {
public:
    static StepMetadata metadata() {
        return StepMetadata("StepWithLinkText")
            .link("https://www.example.com", "This is the link text");
    }

    Result<StepVerdict> run(StepContext&) override { return StepVerdict::pass(); }
};

class StepWithButtons : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepWithButtons"); }

    Result<StepVerdict> run(StepContext& context) override {
        auto first = context.present_buttons({"Button 1", "Button 2", "Button 3"});
        if (core::errors::is_error(first)) {
            return core::errors::get_error(first);
        }
        context.log("You clicked: " + core::errors::get_value(first).dump());

        auto second = context.present_buttons(
            {{"Button 4", "Value 1"}, {"This is green", true}, {"Button 6", 42}});
        if (core::errors::is_error(second)) {
            return core::errors::get_error(second);
        }
        context.log("You clicked: " + core::errors::get_value(second).dump());
        return StepVerdict::pass();
    }
};

class PassFailButtons : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("PassFailButtons"); }

    Result<StepVerdict> run(StepContext& context) override {
        auto response = context.present_pass_fail_buttons();
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        context.log(std::string("You clicked: ") +
                    (core::errors::get_value(response) ? "Pass" : "Fail"));
        return StepVerdict::pass();
    }
};

class StepWithTextInput : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepWithTextInput"); }

    Result<StepVerdict> run(StepContext& context) override {
        auto response = context.present_text_input("What is your name?", 25);
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        context.log("Your name is: " + core::errors::get_value(response));
        return StepVerdict::pass();
    }
};

class StepWithRadios : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepWithRadios"); }

    Result<StepVerdict> run(StepContext& context) override {
        auto response = context.present_radios(
            "Choose exactly 1", {"Choice 1", "Choice 2", "Choice 3"});
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        context.log("You selected: " + describe(core::errors::get_value(response)));
        return StepVerdict::pass();
    }
};

class StepWithCheckBoxes : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepWithCheckBoxes"); }

    Result<StepVerdict> run(StepContext& context) override {
        auto response = context.present_checkboxes(
            "Choose as many as you want", {"Choice 1", "Choice 2", "Choice 3"});
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        context.log("You selected: " + describe(core::errors::get_value(response)));
        return StepVerdict::pass();
    }
};

class StepWithSelect : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepWithSelect"); }

    Result<StepVerdict> run(StepContext& context) override {
        auto response = context.present_multi_select(
            "Choose from the dropdown", {"Choice 1", "Choice 2", "Choice 3"});
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        context.log("You selected: " + describe(core::errors::get_value(response)));
        return StepVerdict::pass();
    }
};

class StepThatReadsSecret : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("StepThatReadsSecret"); }

    Result<StepVerdict> run(StepContext& context) override {
        auto secret = context.get_secret("FOO");
        if (core::errors::is_error(secret)) {
            return core::errors::get_error(secret);
        }
        context.log("The secret is " + core::errors::get_value(secret));
        return StepVerdict::pass();
    }
};

class Shutdown : public runtime::Step {
public:
    static StepMetadata metadata() { return StepMetadata("Shutdown"); }

    Result<StepVerdict> run(StepContext& context) override {
        context.log("Run state holds " + std::to_string(context.state().size()) +
                    " key(s); shutting down.");
        return StepVerdict::pass();
    }
};

}  // namespace

Result<runtime::RunPlan> build_demo_plan() {
    runtime::StepRegistry registry;
    registry.add<EmptyStep>()
        .add<StepWithDisplayName>()
        .add<StepWithDescription>()
        .add<StepThatSetsState>()
        .add<StepThatReadsState>()
        .add<StepThatCanFail>()
        .add<StepWithImage>()
        .add<StepWithLink>()
        .add<StepWithLinkText>()
        .add<StepWithButtons>()
        .add<PassFailButtons>()
        .add<StepWithTextInput>()
        .add<StepWithRadios>()
        .add<StepWithCheckBoxes>()
        .add<StepWithSelect>()
        .add<StepThatReadsSecret>()
        .finalizer<Shutdown>();
    return registry.build();
}

}  // namespace station::app
