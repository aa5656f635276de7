// sympathetic-play entry point.
// Plays a sequence of notes (or one chord) through the voice engine,
// either on the default sound card or rendered offline.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include "AudioDeviceContext.h"
#include "OfflineAudioContext.h"
#include "core/NoteConversion.h"
#include "core/PatchSerialization.h"
#include "core/SynthEngine.h"

namespace {

std::vector<std::string> splitNoteList(const std::string& input)
{
	std::vector<std::string> notes;
	std::string current;
	for (const char ch : input) {
		if (ch == ',' || std::isspace(static_cast<unsigned char>(ch))) {
			if (!current.empty()) {
				notes.push_back(current);
				current.clear();
			}
			continue;
		}
		current.push_back(ch);
	}
	if (!current.empty()) {
		notes.push_back(current);
	}
	return notes;
}

std::optional<int> parseMidiNote(const std::string& value)
{
	try {
		std::size_t consumed = 0;
		const int note = std::stoi(value, &consumed);
		if (consumed != value.size() || note < 0 || note > 127) {
			return std::nullopt;
		}
		return note;
	} catch (const std::exception&) {
		return std::nullopt;
	}
}

// Moves time forward. Offline contexts render (and report the peak of
// what they rendered); device contexts just wait for the callback.
class Transport {
public:
	Transport(sympathetic::AudioGraphContext& context, sympathetic::OfflineAudioContext* offline)
	    : context_(context), offline_(offline)
	{
	}

	void wait(const double seconds)
	{
		if (seconds <= 0.0) {
			return;
		}
		if (offline_ != nullptr) {
			peak_ = std::max(peak_, offline_->advance(seconds));
			return;
		}
		juce::Thread::sleep(static_cast<int>(std::lround(seconds * 1000.0)));
		peak_ = std::max(peak_, context_.history().peak(seconds));
	}

	[[nodiscard]] float takePeak()
	{
		const float peak = peak_;
		peak_ = 0.0F;
		return peak;
	}

private:
	sympathetic::AudioGraphContext& context_;
	sympathetic::OfflineAudioContext* offline_;
	float peak_{0.0F};
};

}  // namespace

int main(int argc, char** argv)
{
	argparse::ArgumentParser program("sympathetic-play", "0.1.0", argparse::default_arguments::all, true);
	program.add_description("sympathetic-play: play notes through the polyphonic voice engine.");
	program.add_argument("-n", "--notes")
	    .help("Comma separated note names (e.g. C4,E4,G4) or MIDI numbers with --midi.")
	    .default_value(std::string{"A4"});
	program.add_argument("--midi")
	    .help("Read --notes as MIDI note numbers and send them as MIDI events.")
	    .flag();
	program.add_argument("-c", "--chord")
	    .help("Start every note at once instead of one after another.")
	    .flag();
	program.add_argument("--hold")
	    .help("Seconds each note (or the chord) is held before release.")
	    .scan<'g', double>()
	    .default_value(0.5);
	program.add_argument("--gap")
	    .help("Seconds between the release of a note and the next note.")
	    .scan<'g', double>()
	    .default_value(0.1);
	program.add_argument("-s", "--set")
	    .help("Patch assignment key=value (repeatable), e.g. --set filterCutoff=5000.")
	    .append()
	    .default_value(std::vector<std::string>{});
	program.add_argument("--list-keys")
	    .help("Print every accepted patch key and exit.")
	    .flag();
	program.add_argument("--offline")
	    .help("Render without a sound card and report output levels.")
	    .flag();
	program.add_argument("-r", "--sample-rate")
	    .help("Sample rate used with --offline.")
	    .scan<'i', int>()
	    .default_value(44100);
	program.add_argument("--dump-graph")
	    .help("Print the signal graph while the notes are held.")
	    .flag();
	program.add_argument("--dump-patch")
	    .help("Print the clamped patch built from --set.")
	    .flag();

	try {
		program.parse_args(argc, argv);
	} catch (const std::exception& err) {
		std::cerr << err.what() << std::endl;
		std::cerr << program;
		return 1;
	}

	if (program.get<bool>("--list-keys")) {
		for (const auto& key : sympathetic::SupportedPatchKeys()) {
			std::cout << key << std::endl;
		}
		return 0;
	}

	sympathetic::SynthPatch patch;
	for (const auto& assignment : program.get<std::vector<std::string>>("--set")) {
		std::string error;
		if (!sympathetic::ParsePatchAssignment(assignment, patch, &error)) {
			std::cerr << "[sympathetic-play] " << error << std::endl;
			return 1;
		}
	}
	patch = sympathetic::ClampPatch(patch);

	if (program.get<bool>("--dump-patch")) {
		std::cout << sympathetic::SerializePatch(patch);
	}

	const bool useMidi = program.get<bool>("--midi");
	const auto notes = splitNoteList(program.get<std::string>("--notes"));
	if (notes.empty()) {
		std::cerr << "[sympathetic-play] No notes given." << std::endl;
		return 1;
	}

	std::vector<int> midiNotes;
	if (useMidi) {
		for (const auto& note : notes) {
			const auto midi = parseMidiNote(note);
			if (!midi.has_value()) {
				std::cerr << "[sympathetic-play] Invalid MIDI note '" << note
				          << "' (must be 0-127)." << std::endl;
				return 1;
			}
			midiNotes.push_back(*midi);
		}
	}

	const double hold = std::max(program.get<double>("--hold"), 0.0);
	const double gap = std::max(program.get<double>("--gap"), 0.0);
	const bool offlineMode = program.get<bool>("--offline");

	// The device path needs the JUCE message machinery; offline
	// rendering does not.
	std::unique_ptr<juce::ScopedJuceInitialiser_GUI> juceInit;
	std::unique_ptr<sympathetic::AudioGraphContext> context;
	sympathetic::OfflineAudioContext* offline = nullptr;

	if (offlineMode) {
		const int sampleRate = program.get<int>("--sample-rate");
		if (sampleRate <= 0) {
			std::cerr << "[sympathetic-play] Invalid --sample-rate '" << sampleRate
			          << "' (must be > 0)." << std::endl;
			return 1;
		}
		auto offlineContext = std::make_unique<sympathetic::OfflineAudioContext>(sampleRate);
		offline = offlineContext.get();
		context = std::move(offlineContext);
	} else {
		juceInit = std::make_unique<juce::ScopedJuceInitialiser_GUI>();
		auto device = std::make_unique<sympathetic::AudioDeviceContext>();
		if (device->initError()) {
			std::cerr << "[sympathetic-play] No audio device available. Use --offline to render without one."
			          << std::endl;
			return 1;
		}
		std::cout << "[sympathetic-play] Output device: " << device->deviceName().toStdString() << std::endl;
		context = std::move(device);
	}

	Transport transport(*context, offline);
	{
		sympathetic::SynthEngine engine(*context);
		engine.applyPatch(patch);

		auto noteOn = [&](const std::size_t index) {
			if (useMidi) {
				sympathetic::MidiNoteEvent event;
				event.note = midiNotes[index];
				event.velocity01 = 1.0F;
				event.is_note_on = true;
				engine.handleMidiEvent(event);
			} else {
				engine.playNote(notes[index]);
			}
		};
		auto noteOff = [&](const std::size_t index) {
			if (useMidi) {
				sympathetic::MidiNoteEvent event;
				event.note = midiNotes[index];
				event.is_note_on = false;
				engine.handleMidiEvent(event);
			} else {
				engine.stopNote(notes[index]);
			}
		};
		auto label = [&](const std::size_t index) {
			return useMidi ? sympathetic::MidiToNoteName(midiNotes[index]) : notes[index];
		};
		auto dumpGraph = [&]() {
			if (program.get<bool>("--dump-graph")) {
				std::cout << context->graph().Describe();
			}
		};

		if (program.get<bool>("--chord")) {
			for (std::size_t i = 0; i < notes.size(); ++i) {
				noteOn(i);
			}
			dumpGraph();
			transport.wait(hold);
			std::cout << "[sympathetic-play] chord (" << engine.activeVoiceCount()
			          << " voices) peak " << transport.takePeak() << std::endl;
			engine.stopAll();
		} else {
			for (std::size_t i = 0; i < notes.size(); ++i) {
				noteOn(i);
				if (i == 0) {
					dumpGraph();
				}
				transport.wait(hold);
				const std::string name = label(i);
				std::cout << "[sympathetic-play] " << name << " "
				          << sympathetic::NoteToFrequency(name) << " Hz peak "
				          << transport.takePeak() << std::endl;
				noteOff(i);
				transport.wait(gap);
			}
		}

		// Let the last release tails ring out before tearing down.
		const auto settings = engine.settings();
		transport.wait(settings.volume_envelope.release +
		               sympathetic::SynthEngine::kStopGuardSeconds + 0.05);
		const std::size_t freed = engine.reapFinishedVoices();
		std::cout << "[sympathetic-play] released " << freed << " voices, "
		          << engine.releasingVoiceCount() << " still ringing, tail peak "
		          << transport.takePeak() << std::endl;
	}

	return 0;
}
